#ifndef PENSYNC_OBEX_FOLDER_LISTING_H
#define PENSYNC_OBEX_FOLDER_LISTING_H

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "pensync/core/compat.h"

namespace pensync {
namespace obex {

using Timestamp = std::chrono::system_clock::time_point;

/**
 * One entry of a folder-listing document. A size of 0 marks a folder.
 */
class FolderListingItem {
 public:
  FolderListingItem(std::string name, optional<Timestamp> time, uint64_t size)
      : name_(std::move(name)), time_(time), size_(size) {}

  const std::string& name() const { return name_; }
  const optional<Timestamp>& time() const { return time_; }
  uint64_t size() const { return size_; }
  bool isFolder() const { return size_ == 0; }

  bool operator==(const FolderListingItem& other) const {
    return name_ == other.name_ && time_ == other.time_ &&
           size_ == other.size_;
  }

 private:
  std::string name_;
  optional<Timestamp> time_;
  uint64_t size_;
};

using FolderListing = std::vector<FolderListingItem>;

/**
 * Parse an `x-obex/folder-listing` document.
 *
 * A DOCTYPE declaration is removed before parsing. `folder` and `file`
 * elements anywhere under the root are collected; an element without a
 * name is skipped. The timestamp comes from `modified`, or `created` when
 * `modified` is empty; an unreadable timestamp is logged and left unset.
 * The result is sorted with sortFolderListing().
 *
 * @return nullopt if the document is not well-formed XML.
 */
optional<FolderListing> parseFolderListing(const std::string& xml);

/**
 * Folders before files; within a kind, newest first. Items without a
 * timestamp go after dated items of the same kind and keep their relative
 * order.
 */
void sortFolderListing(FolderListing& items);

/**
 * Parse `YYYYMMDDTHHMMSS` as local time, or as UTC with a trailing `Z`.
 */
optional<Timestamp> parseListingTimestamp(const std::string& text);

/**
 * Remove the first `<!DOCTYPE ...>` declaration, if any.
 */
std::string stripDoctype(const std::string& xml);

}  // namespace obex
}  // namespace pensync

#endif  // PENSYNC_OBEX_FOLDER_LISTING_H
