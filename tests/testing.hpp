#pragma once

#include <archive.h>
#include <archive_entry.h>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace testutil {

class TemporaryDirectory {
  public:
    TemporaryDirectory() {
        char tpl[] = "/tmp/docsan_tests_XXXXXX";
        char* p = ::mkdtemp(tpl);
        if (!p) {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = p;
    }

    ~TemporaryDirectory() {
        if (!path_.empty()) {
            std::error_code ec;
            std::filesystem::remove_all(path_, ec);
        }
    }

    TemporaryDirectory(const TemporaryDirectory&) = delete;
    TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;

    const std::string& Path() const { return path_; }

  private:
    std::string path_;
};

struct ZipEntry {
    std::string path;
    std::string contents;
};

inline std::vector<std::uint8_t> BuildZip(const std::vector<ZipEntry>& entries) {
    std::vector<std::uint8_t> out(4 * 1024 * 1024);
    size_t used = 0;

    archive* a = archive_write_new();
    if (!a)
        throw std::runtime_error("archive_write_new failed");
    if (archive_write_set_format_zip(a) != ARCHIVE_OK) {
        (void)archive_write_free(a);
        throw std::runtime_error("archive_write_set_format_zip failed");
    }
    if (archive_write_open_memory(a, out.data(), out.size(), &used) != ARCHIVE_OK) {
        (void)archive_write_free(a);
        throw std::runtime_error("archive_write_open_memory failed");
    }

    for (const auto& entry : entries) {
        archive_entry* hdr = archive_entry_new();
        if (!hdr) {
            (void)archive_write_free(a);
            throw std::runtime_error("archive_entry_new failed");
        }
        archive_entry_set_pathname(hdr, entry.path.c_str());
        archive_entry_set_filetype(hdr, AE_IFREG);
        archive_entry_set_perm(hdr, 0644);
        archive_entry_set_size(hdr, static_cast<la_int64_t>(entry.contents.size()));
        if (archive_write_header(a, hdr) != ARCHIVE_OK) {
            archive_entry_free(hdr);
            (void)archive_write_free(a);
            throw std::runtime_error("archive_write_header failed");
        }
        if (!entry.contents.empty()) {
            if (archive_write_data(a, entry.contents.data(), entry.contents.size()) < 0) {
                archive_entry_free(hdr);
                (void)archive_write_free(a);
                throw std::runtime_error("archive_write_data failed");
            }
        }
        archive_entry_free(hdr);
    }

    if (archive_write_close(a) != ARCHIVE_OK) {
        (void)archive_write_free(a);
        throw std::runtime_error("archive_write_close failed");
    }
    if (archive_write_free(a) != ARCHIVE_OK) {
        throw std::runtime_error("archive_write_free failed");
    }
    out.resize(used);
    return out;
}

inline bool WriteBytesFile(const std::string& path, const std::vector<std::uint8_t>& content) {
    std::ofstream os(path, std::ios::binary);
    if (!os.good()) {
        return false;
    }
    os.write(reinterpret_cast<const char*>(content.data()),
             static_cast<std::streamsize>(content.size()));
    return os.good();
}

inline bool WriteTextFile(const std::string& path, const std::string& content) {
    std::filesystem::create_directories(std::filesystem::path(path).parent_path());
    std::ofstream os(path, std::ios::binary);
    if (!os.good()) {
        return false;
    }
    os << content;
    return os.good();
}

inline std::string ReadFile(const std::filesystem::path& p) {
    std::ifstream ifs(p, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
}

// Entries in archive order, or nullopt if the file is not a
// readable zip.
inline std::optional<std::vector<ZipEntry>> ReadZip(const std::string& path) {
    archive* a = archive_read_new();
    if (!a)
        return std::nullopt;
    archive_read_support_format_zip(a);
    if (archive_read_open_filename(a, path.c_str(), 10240) != ARCHIVE_OK) {
        (void)archive_read_free(a);
        return std::nullopt;
    }

    std::vector<ZipEntry> out;
    archive_entry* entry = nullptr;
    while (true) {
        const int r = archive_read_next_header(a, &entry);
        if (r == ARCHIVE_EOF)
            break;
        if (r != ARCHIVE_OK) {
            (void)archive_read_free(a);
            return std::nullopt;
        }

        ZipEntry e;
        e.path = archive_entry_pathname(entry);
        char buf[8192];
        while (true) {
            const la_ssize_t n = archive_read_data(a, buf, sizeof(buf));
            if (n == 0)
                break;
            if (n < 0) {
                (void)archive_read_free(a);
                return std::nullopt;
            }
            e.contents.append(buf, static_cast<size_t>(n));
        }
        out.push_back(std::move(e));
    }

    (void)archive_read_free(a);
    return out;
}

inline std::map<std::string, std::string> ZipToMap(const std::vector<ZipEntry>& entries) {
    std::map<std::string, std::string> out;
    for (const auto& e : entries) {
        out[e.path] = e.contents;
    }
    return out;
}

inline constexpr const char* kContentTypesXml =
    "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n"
    "<Types xmlns=\"http://schemas.openxmlformats.org/package/2006/content-types\">"
    "<Default Extension=\"rels\" ContentType=\"application/vnd.openxmlformats-package.relationships+xml\"/>"
    "<Default Extension=\"xml\" ContentType=\"application/xml\"/>"
    "<Override PartName=\"/word/document.xml\" "
    "ContentType=\"application/vnd.openxmlformats-officedocument.wordprocessingml.document.main+xml\"/>"
    "<Override PartName=\"/word/comments.xml\" "
    "ContentType=\"application/vnd.openxmlformats-officedocument.wordprocessingml.comments+xml\"/>"
    "<Override PartName=\"/word/commentsExtended.xml\" "
    "ContentType=\"application/vnd.openxmlformats-officedocument.wordprocessingml.commentsExtended+xml\"/>"
    "<Override PartName=\"/word/styles.xml\" "
    "ContentType=\"application/vnd.openxmlformats-officedocument.wordprocessingml.styles+xml\"/>"
    "</Types>";

inline constexpr const char* kDocumentRelsXml =
    "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n"
    "<Relationships xmlns=\"http://schemas.openxmlformats.org/package/2006/relationships\">"
    "<Relationship Id=\"rId1\" "
    "Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/styles\" "
    "Target=\"styles.xml\"/>"
    "<Relationship Id=\"rId2\" "
    "Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/comments\" "
    "Target=\"comments.xml\"/>"
    "<Relationship Id=\"rId3\" "
    "Type=\"http://schemas.microsoft.com/office/2011/relationships/commentsExtended\" "
    "Target=\"CommentsExtended.xml\"/>"
    "</Relationships>";

inline constexpr const char* kPackageRelsXml =
    "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n"
    "<Relationships xmlns=\"http://schemas.openxmlformats.org/package/2006/relationships\">"
    "<Relationship Id=\"rId1\" "
    "Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/officeDocument\" "
    "Target=\"word/document.xml\"/>"
    "</Relationships>";

inline std::string WrapBody(const std::string& body) {
    return "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>\n"
           "<w:document xmlns:w=\"http://schemas.openxmlformats.org/wordprocessingml/2006/main\" "
           "xmlns:mc=\"http://schemas.openxmlformats.org/markup-compatibility/2006\">"
           "<w:body>" + body + "</w:body></w:document>";
}

// A complete package around document_xml, including the comment parts.
inline std::vector<ZipEntry> DocxEntries(const std::string& document_xml) {
    return {
        {"[Content_Types].xml", kContentTypesXml},
        {"_rels/.rels", kPackageRelsXml},
        {"word/document.xml", document_xml},
        {"word/_rels/document.xml.rels", kDocumentRelsXml},
        {"word/styles.xml", "<w:styles/>"},
        {"word/comments.xml", "<w:comments><w:comment w:id=\"0\"/></w:comments>"},
        {"word/commentsExtended.xml", "<w15:commentsEx/>"},
        {"word/commentsIds.xml", "<w16cid:commentsIds/>"},
        {"word/commentsExtensible.xml", "<w16cex:commentsExtensible/>"},
        {"word/media/image1.png", std::string("\x89PNG\r\n\x1a\n", 8)},
    };
}

inline bool WriteDocx(const std::string& path, const std::string& document_xml) {
    return WriteBytesFile(path, BuildZip(DocxEntries(document_xml)));
}

} // namespace testutil
