#include "message_filter.hpp"

#include <cctype>

namespace failover::store {

namespace {

constexpr const char* kSubscribeAll = "*";

std::string Trim(const std::string& value) {
  size_t begin = 0;
  size_t end   = value.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(value[begin]))) ++begin;
  while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1]))) --end;
  return value.substr(begin, end - begin);
}

} // namespace

TagFilter::TagFilter(const std::string& expression) {
  const auto trimmed = Trim(expression);
  if (trimmed.empty() || trimmed == kSubscribeAll) {
    subscribe_all_ = true;
    return;
  }

  size_t start = 0;
  while (start <= trimmed.size()) {
    const auto sep = trimmed.find("||", start);
    const auto tag = Trim(trimmed.substr(start, sep == std::string::npos ? std::string::npos : sep - start));
    if (!tag.empty()) {
      tags_.insert(tag);
    }
    if (sep == std::string::npos) {
      break;
    }
    start = sep + 2;
  }

  if (tags_.empty()) {
    subscribe_all_ = true;
  }
}

bool TagFilter::IsMatched(const failover::broker::v1::Message& message) const {
  if (subscribe_all_) {
    return true;
  }
  return tags_.count(message.tags()) > 0;
}

std::shared_ptr<MessageFilter> MakeTagFilter(const std::string& expression) {
  auto filter = std::make_shared<TagFilter>(expression);
  if (filter->subscribes_all()) {
    return nullptr;
  }
  return filter;
}

} // namespace failover::store
