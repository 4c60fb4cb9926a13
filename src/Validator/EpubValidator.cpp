#include "EpubValidator.hpp"

#include <pugixml.hpp>
#include <zip.h>

#include <cstring>
#include <memory>
#include <string>
#include <utility>

namespace docfetch {

namespace {

// container.xml and the package document are small; larger entries are not
// read.
constexpr zip_uint64_t kMaxXmlEntryBytes = 4 * 1024 * 1024;
constexpr zip_uint64_t kMaxMimetypeBytes = 128;

struct ZipDiscard {
  void operator()(zip_t* archive) const { zip_discard(archive); }
};
using ZipArchive = std::unique_ptr<zip_t, ZipDiscard>;

// Reads one archive entry into *out; error text on failure.
std::optional<std::string> readEntry(zip_t* archive, const std::string& name,
                                     zip_uint64_t maxBytes, std::string* out) {
  zip_stat_t st;
  zip_stat_init(&st);
  if (zip_stat(archive, name.c_str(), 0, &st) != 0) {
    return name + " missing";
  }
  if (!(st.valid & ZIP_STAT_SIZE) || st.size > maxBytes) {
    return name + " is too large";
  }
  zip_file_t* entry = zip_fopen(archive, name.c_str(), 0);
  if (!entry) {
    return "Cannot open " + name + ": " + zip_strerror(archive);
  }
  out->assign(static_cast<size_t>(st.size), '\0');
  zip_int64_t n = st.size > 0 ? zip_fread(entry, &(*out)[0], st.size) : 0;
  std::string readError = n < 0 ? zip_file_strerror(entry) : "";
  zip_fclose(entry);
  if (n < 0) {
    return "Cannot read " + name + ": " + readError;
  }
  if (static_cast<zip_uint64_t>(n) != st.size) {
    return "Short read on " + name;
  }
  return std::nullopt;
}

// Element name without its namespace prefix.
const char* localName(const pugi::xml_node& node) {
  const char* name = node.name();
  const char* colon = std::strchr(name, ':');
  return colon ? colon + 1 : name;
}

pugi::xml_node childByLocalName(const pugi::xml_node& parent, const char* name) {
  for (pugi::xml_node child : parent.children()) {
    if (std::strcmp(localName(child), name) == 0) return child;
  }
  return pugi::xml_node();
}

}  // namespace

ValidationOutcome EpubValidator::validate(const std::filesystem::path& path) const {
  uintmax_t size = 0;
  if (auto error = checkRegularFile(path, &size)) {
    return ValidationOutcome::failure(*error);
  }
  if (size == 0) {
    return ValidationOutcome::failure("File is empty");
  }

  int code = 0;
  ZipArchive archive(zip_open(path.string().c_str(), ZIP_RDONLY | ZIP_CHECKCONS, &code));
  if (!archive) {
    zip_error_t error;
    zip_error_init_with_code(&error, code);
    std::string reason = std::string("Not a readable ZIP container: ") + zip_error_strerror(&error);
    zip_error_fini(&error);
    return ValidationOutcome::failure(reason);
  }
  zip_int64_t entries = zip_get_num_entries(archive.get(), 0);
  if (entries <= 0) {
    return ValidationOutcome::failure("EPUB container is empty");
  }

  std::string containerXml;
  if (auto error = readEntry(archive.get(), "META-INF/container.xml", kMaxXmlEntryBytes,
                             &containerXml)) {
    return ValidationOutcome::failure(*error);
  }
  pugi::xml_document container;
  pugi::xml_parse_result parsed = container.load_buffer(containerXml.data(), containerXml.size());
  if (!parsed) {
    return ValidationOutcome::failure(std::string("Malformed container.xml: ") +
                                      parsed.description());
  }
  std::string packagePath = container.child("container")
                                .child("rootfiles")
                                .child("rootfile")
                                .attribute("full-path")
                                .value();
  if (packagePath.empty()) {
    return ValidationOutcome::failure("container.xml names no package document");
  }

  std::string packageXml;
  if (auto error = readEntry(archive.get(), packagePath, kMaxXmlEntryBytes, &packageXml)) {
    return ValidationOutcome::failure(*error);
  }
  pugi::xml_document package;
  parsed = package.load_buffer(packageXml.data(), packageXml.size());
  if (!parsed) {
    return ValidationOutcome::failure("Malformed package document " + packagePath + ": " +
                                      parsed.description());
  }
  pugi::xml_node root = package.document_element();
  if (std::strcmp(localName(root), "package") != 0) {
    return ValidationOutcome::failure(packagePath + " is not an OPF package document");
  }

  auto outcome = ValidationOutcome::success();
  outcome.metadata["entries"] = std::to_string(entries);
  outcome.metadata["package"] = packagePath;

  std::string mimetype;
  if (!readEntry(archive.get(), "mimetype", kMaxMimetypeBytes, &mimetype)) {
    outcome.metadata["mimetype"] = mimetype;
  }

  // dc:title / dc:creator / dc:language
  pugi::xml_node metadata = childByLocalName(root, "metadata");
  const std::pair<const char*, const char*> fields[] = {
      {"title", "title"}, {"creator", "author"}, {"language", "language"}};
  for (const auto& field : fields) {
    std::string value = childByLocalName(metadata, field.first).child_value();
    if (!value.empty()) outcome.metadata[field.second] = value;
  }
  return outcome;
}

}  // namespace docfetch
