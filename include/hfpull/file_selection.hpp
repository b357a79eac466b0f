#ifndef HFPULL_FILE_SELECTION_HPP
#define HFPULL_FILE_SELECTION_HPP

#include "hfpull/repository_lister.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace hfpull {

// Check-list over a repository listing. Everything starts selected.
// Bulk operations only touch entries that pass the current filter.
class FileSelection {
public:
  explicit FileSelection(std::vector<RemoteFileEntry> entries);

  void toggle(size_t index);
  void setSelected(size_t index, bool selected);
  bool isSelected(size_t index) const;

  void selectAll();
  void invert();
  void clear();

  // Case-insensitive substring match on the relative path; empty shows all.
  void setFilter(const std::string &text);
  const std::string &filter() const { return filter_; }
  bool isVisible(size_t index) const;

  std::vector<size_t> visibleIndices() const;
  // Selected and visible, in listing order.
  std::vector<size_t> selectedIndices() const;
  size_t selectedCount() const;
  std::uint64_t selectedBytes() const;

  const std::vector<RemoteFileEntry> &entries() const { return entries_; }

private:
  std::vector<RemoteFileEntry> entries_;
  std::vector<bool> selected_;
  std::string filter_;
};

// Parses "0,2,5-7" into {0, 2, 5, 6, 7}. Whitespace is ignored, duplicates are
// kept once, order of first appearance is preserved.
// Throws std::invalid_argument for malformed text and std::out_of_range for an
// index or range end >= limit, before any range is expanded.
std::vector<size_t> parseIndexList(const std::string &text, size_t limit);

} // namespace hfpull

#endif // HFPULL_FILE_SELECTION_HPP
