#include "pensync/obex/folder_listing.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <ctime>
#include <memory>
#include <mutex>

#include <libxml/parser.h>
#include <libxml/tree.h>

#undef PENSYNC_LOG_COMPONENT
#define PENSYNC_LOG_COMPONENT "obex"
#include "pensync/logging/log_macros.h"

namespace pensync {
namespace obex {

namespace {

struct XmlDocDeleter {
  void operator()(xmlDoc* doc) const { xmlFreeDoc(doc); }
};
using XmlDocPtr = std::unique_ptr<xmlDoc, XmlDocDeleter>;

struct XmlCharDeleter {
  void operator()(xmlChar* text) const { xmlFree(text); }
};
using XmlCharPtr = std::unique_ptr<xmlChar, XmlCharDeleter>;

void ensureXmlInitialized() {
  static std::once_flag init_flag;
  std::call_once(init_flag, []() { xmlInitParser(); });
}

std::string attribute(xmlNode* node, const char* name) {
  XmlCharPtr value(xmlGetProp(node, reinterpret_cast<const xmlChar*>(name)));
  if (!value) {
    return std::string();
  }
  return std::string(reinterpret_cast<const char*>(value.get()));
}

bool hasAttribute(xmlNode* node, const char* name) {
  return xmlHasProp(node, reinterpret_cast<const xmlChar*>(name)) != nullptr;
}

bool isElement(xmlNode* node, const char* tag) {
  return node->type == XML_ELEMENT_NODE &&
         xmlStrcmp(node->name, reinterpret_cast<const xmlChar*>(tag)) == 0;
}

// Depth-first, document order
void collect(xmlNode* parent, const char* tag, std::vector<xmlNode*>& out) {
  for (xmlNode* child = parent->children; child; child = child->next) {
    if (child->type != XML_ELEMENT_NODE) {
      continue;
    }
    if (isElement(child, tag)) {
      out.push_back(child);
    }
    collect(child, tag, out);
  }
}

optional<Timestamp> itemTimestamp(xmlNode* node, const std::string& name) {
  std::string text = attribute(node, "modified");
  if (text.empty()) {
    text = attribute(node, "created");
  }
  if (text.empty()) {
    return nullopt;
  }
  auto time = parseListingTimestamp(text);
  if (!time) {
    LOG_WARNING("unreadable timestamp '{}' on '{}'", text, name);
  }
  return time;
}

uint64_t itemSize(xmlNode* node, const std::string& name) {
  std::string text = attribute(node, "size");
  if (text.empty() || !std::all_of(text.begin(), text.end(), [](char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
      })) {
    LOG_WARNING("missing or invalid size '{}' on file '{}'", text, name);
    return 0;
  }
  return std::strtoull(text.c_str(), nullptr, 10);
}

bool allDigits(const std::string& s, size_t from, size_t count) {
  for (size_t i = from; i < from + count; ++i) {
    if (!std::isdigit(static_cast<unsigned char>(s[i]))) {
      return false;
    }
  }
  return true;
}

int field(const std::string& s, size_t from, size_t count) {
  return std::atoi(s.substr(from, count).c_str());
}

}  // namespace

std::string stripDoctype(const std::string& xml) {
  auto start = xml.find("<!DOCTYPE");
  if (start == std::string::npos) {
    return xml;
  }
  auto end = xml.find('>', start);
  if (end == std::string::npos) {
    return xml;
  }
  std::string out = xml.substr(0, start);
  out += xml.substr(end + 1);
  return out;
}

optional<Timestamp> parseListingTimestamp(const std::string& text) {
  // YYYYMMDDTHHMMSS[Z]
  if (text.size() < 15 || text[8] != 'T' || !allDigits(text, 0, 8) ||
      !allDigits(text, 9, 6)) {
    return nullopt;
  }
  bool utc = text.size() > 15 && text[15] == 'Z';

  std::tm tm{};
  tm.tm_year = field(text, 0, 4) - 1900;
  tm.tm_mon = field(text, 4, 2) - 1;
  tm.tm_mday = field(text, 6, 2);
  tm.tm_hour = field(text, 9, 2);
  tm.tm_min = field(text, 11, 2);
  tm.tm_sec = field(text, 13, 2);
  tm.tm_isdst = -1;

  if (tm.tm_mon < 0 || tm.tm_mon > 11 || tm.tm_mday < 1 || tm.tm_mday > 31 ||
      tm.tm_hour > 23 || tm.tm_min > 59 || tm.tm_sec > 60) {
    return nullopt;
  }

  std::time_t t = utc ? timegm(&tm) : std::mktime(&tm);
  if (t == static_cast<std::time_t>(-1)) {
    return nullopt;
  }
  return std::chrono::system_clock::from_time_t(t);
}

void sortFolderListing(FolderListing& items) {
  std::stable_sort(items.begin(), items.end(),
                   [](const FolderListingItem& lhs,
                      const FolderListingItem& rhs) {
                     if (lhs.isFolder() != rhs.isFolder()) {
                       return lhs.isFolder();
                     }
                     if (lhs.time() && rhs.time()) {
                       return *lhs.time() > *rhs.time();
                     }
                     // Dated before undated
                     return lhs.time().has_value() && !rhs.time().has_value();
                   });
}

optional<FolderListing> parseFolderListing(const std::string& xml) {
  ensureXmlInitialized();

  std::string cleaned = stripDoctype(xml);
  XmlDocPtr doc(xmlReadMemory(cleaned.data(), static_cast<int>(cleaned.size()),
                              "folder-listing.xml", nullptr,
                              XML_PARSE_NONET | XML_PARSE_NOERROR |
                                  XML_PARSE_NOWARNING));
  if (!doc) {
    LOG_ERROR("folder listing is not well-formed ({} bytes)", xml.size());
    return nullopt;
  }

  xmlNode* root = xmlDocGetRootElement(doc.get());
  if (!root) {
    LOG_ERROR("folder listing has no root element");
    return nullopt;
  }

  FolderListing items;

  std::vector<xmlNode*> folders;
  collect(root, "folder", folders);
  for (xmlNode* node : folders) {
    if (!hasAttribute(node, "name")) {
      LOG_WARNING("skipping folder element without name");
      continue;
    }
    std::string name = attribute(node, "name");
    items.emplace_back(name, itemTimestamp(node, name), 0);
  }

  std::vector<xmlNode*> files;
  collect(root, "file", files);
  for (xmlNode* node : files) {
    if (!hasAttribute(node, "name")) {
      LOG_WARNING("skipping file element without name");
      continue;
    }
    std::string name = attribute(node, "name");
    items.emplace_back(name, itemTimestamp(node, name), itemSize(node, name));
  }

  sortFolderListing(items);
  return items;
}

}  // namespace obex
}  // namespace pensync
