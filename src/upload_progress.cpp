#include "vimeo/upload_progress.hpp"

#include <cctype>
#include <charconv>

namespace vimeo {
namespace {

std::string_view trim(std::string_view value) {
  while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front()))) {
    value.remove_prefix(1);
  }
  while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
    value.remove_suffix(1);
  }
  return value;
}

std::optional<std::uint64_t> parse_unsigned(std::string_view text) {
  text = trim(text);
  if (text.empty()) {
    return std::nullopt;
  }
  std::uint64_t value = 0;
  auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || end != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

}  // namespace

ProgressUpdate next_offset(std::string_view range_header, std::uint64_t previous_offset, std::uint64_t total_length) {
  auto hyphen = range_header.find('-');
  if (hyphen == std::string_view::npos) {
    return {previous_offset, false};
  }
  auto end = parse_unsigned(range_header.substr(hyphen + 1));
  if (!end || *end > total_length) {
    return {previous_offset, false};
  }
  return {*end, true};
}

ProgressDecision TransferWindow::advance(std::optional<std::string_view> range_header,
                                         std::size_t max_stalled_rounds) const {
  ProgressDecision decision;
  decision.offset = confirmed_offset;

  ProgressUpdate update{confirmed_offset, false};
  if (range_header) {
    update = next_offset(*range_header, confirmed_offset, total_length);
  }

  if (update.made_progress) {
    decision.offset = update.offset;
    if (update.offset == total_length) {
      decision.status = ProgressStatus::Complete;
      return decision;
    }
    if (update.offset > confirmed_offset) {
      decision.status = ProgressStatus::Progress;
      return decision;
    }
  }

  decision.stalled_rounds = stalled_rounds + 1;
  decision.status = decision.stalled_rounds >= max_stalled_rounds ? ProgressStatus::Abort
                                                                   : ProgressStatus::NoProgressRetry;
  return decision;
}

void TransferWindow::apply(const ProgressDecision& decision) {
  confirmed_offset = decision.offset;
  stalled_rounds = decision.stalled_rounds;
}

}  // namespace vimeo
