#include "hfpull/file_selection.hpp"
#include <algorithm>
#include <cctype>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace hfpull {

namespace {

std::string toLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

size_t parseIndex(const std::string &token) {
  if (token.empty() ||
      !std::all_of(token.begin(), token.end(),
                   [](unsigned char c) { return std::isdigit(c); }))
    throw std::invalid_argument("Invalid index: '" + token + "'");
  try {
    return static_cast<size_t>(std::stoull(token));
  } catch (const std::out_of_range &) {
    throw std::invalid_argument("Index out of range: '" + token + "'");
  }
}

} // namespace

FileSelection::FileSelection(std::vector<RemoteFileEntry> entries)
    : entries_(std::move(entries)), selected_(entries_.size(), true) {}

void FileSelection::toggle(size_t index) {
  setSelected(index, !isSelected(index));
}

void FileSelection::setSelected(size_t index, bool selected) {
  selected_.at(index) = selected;
}

bool FileSelection::isSelected(size_t index) const {
  return selected_.at(index);
}

void FileSelection::selectAll() {
  for (size_t i : visibleIndices())
    selected_[i] = true;
}

void FileSelection::invert() {
  for (size_t i : visibleIndices())
    selected_[i] = !selected_[i];
}

void FileSelection::clear() {
  for (size_t i : visibleIndices())
    selected_[i] = false;
}

void FileSelection::setFilter(const std::string &text) { filter_ = text; }

bool FileSelection::isVisible(size_t index) const {
  if (filter_.empty())
    return true;
  return toLower(entries_.at(index).relativePath).find(toLower(filter_)) !=
         std::string::npos;
}

std::vector<size_t> FileSelection::visibleIndices() const {
  std::vector<size_t> out;
  for (size_t i = 0; i < entries_.size(); ++i) {
    if (isVisible(i))
      out.push_back(i);
  }
  return out;
}

std::vector<size_t> FileSelection::selectedIndices() const {
  std::vector<size_t> out;
  for (size_t i : visibleIndices()) {
    if (selected_[i])
      out.push_back(i);
  }
  return out;
}

size_t FileSelection::selectedCount() const {
  return selectedIndices().size();
}

std::uint64_t FileSelection::selectedBytes() const {
  std::uint64_t total = 0;
  for (size_t i : selectedIndices())
    total += entries_[i].sizeBytes;
  return total;
}

std::vector<size_t> parseIndexList(const std::string &text, size_t limit) {
  std::vector<size_t> out;
  std::set<size_t> seen;
  auto add = [&](size_t i) {
    if (seen.insert(i).second)
      out.push_back(i);
  };

  std::string cleaned;
  for (char c : text) {
    if (!std::isspace(static_cast<unsigned char>(c)))
      cleaned.push_back(c);
  }
  if (cleaned.empty())
    throw std::invalid_argument("Empty index list");

  std::stringstream ss(cleaned);
  std::string token;
  auto checkBound = [&](size_t i) {
    if (i >= limit)
      throw std::out_of_range("Index " + std::to_string(i) +
                              " is out of range (" + std::to_string(limit) +
                              " entries)");
  };
  while (std::getline(ss, token, ',')) {
    auto dash = token.find('-');
    if (dash == std::string::npos) {
      size_t index = parseIndex(token);
      checkBound(index);
      add(index);
      continue;
    }
    size_t first = parseIndex(token.substr(0, dash));
    size_t last = parseIndex(token.substr(dash + 1));
    if (last < first)
      throw std::invalid_argument("Descending range: '" + token + "'");
    checkBound(last);
    for (size_t i = first; i <= last; ++i)
      add(i);
  }
  if (!cleaned.empty() && cleaned.back() == ',')
    throw std::invalid_argument("Trailing comma in index list");
  return out;
}

} // namespace hfpull
