/// @file extractor.cpp
/// @brief Extractor evaluation.

#include "scenario/extractor.hpp"
#include "core/overloaded.hpp"
#include "core/strings.hpp"
#include "scenario/session_store.hpp"

#include <charconv>
#include <utility>

namespace loadcurve {

namespace {

auto failure(ExtractionFailureKind kind, std::string detail)
    -> std::unexpected<ExtractionFailure> {
  return std::unexpected(
      ExtractionFailure{.kind = kind, .variable = {}, .detail = std::move(detail)});
}

auto extract_json(const JsonPathExtractor &e, const HttpResponse &response)
    -> std::expected<std::string, ExtractionFailure> {
  auto path = parse_json_path(e.path);
  if (!path.has_value()) {
    return failure(ExtractionFailureKind::InvalidPath, path.error());
  }
  const auto doc = nlohmann::json::parse(response.body, nullptr, false);
  if (doc.is_discarded()) {
    return failure(ExtractionFailureKind::InvalidJson,
                   "response body is not JSON");
  }
  const auto *node = resolve_json_path(doc, *path);
  if (node == nullptr) {
    return failure(ExtractionFailureKind::PathNotFound, e.path);
  }
  return render_json_value(*node);
}

auto extract_regex(const RegexExtractor &e, const HttpResponse &response)
    -> std::expected<std::string, ExtractionFailure> {
  const auto &source = e.pattern.source();
  if (!e.pattern.compiled()) {
    return failure(ExtractionFailureKind::InvalidRegex,
                   "'" + source + "' was not compiled");
  }

  auto groups = e.pattern.search(response.body);
  if (!groups.has_value()) {
    return failure(ExtractionFailureKind::MatchAborted,
                   source + ": " + groups.error());
  }
  if (groups->empty()) {
    return failure(ExtractionFailureKind::NoMatch, source);
  }

  std::size_t group = groups->size() > 1 ? 1 : 0;
  if (!e.group.empty()) {
    auto [ptr, ec] = std::from_chars(e.group.data(),
                                     e.group.data() + e.group.size(), group);
    if (ec != std::errc{} || group >= groups->size()) {
      return failure(ExtractionFailureKind::NoMatch,
                     "capture group " + e.group + " not in " + source);
    }
  }
  return std::move((*groups)[group]);
}

auto extract_header(const HeaderExtractor &e, const HttpResponse &response)
    -> std::expected<std::string, ExtractionFailure> {
  if (auto v = response.header(e.name)) {
    return std::string{*v};
  }
  return failure(ExtractionFailureKind::HeaderNotFound, e.name);
}

auto extract_cookie(const CookieExtractor &e, const HttpResponse &response)
    -> std::expected<std::string, ExtractionFailure> {
  for (const auto &[name, value] : response.headers) {
    if (!iequals(name, "set-cookie")) {
      continue;
    }
    if (auto kv = parse_set_cookie(value); kv && kv->first == e.name) {
      return kv->second;
    }
  }
  return failure(ExtractionFailureKind::CookieNotFound, e.name);
}

} // namespace

auto parse_json_path(std::string_view path)
    -> std::expected<std::vector<PathSegment>, std::string> {
  std::vector<PathSegment> segments;
  std::size_t i = 0;

  if (path.starts_with('$')) {
    i = 1;
  }

  bool expect_key = i == 0; // "a.b" without a leading "$".
  while (i < path.size()) {
    const char c = path[i];
    if (c == '.' || expect_key) {
      if (c == '.') {
        ++i;
      }
      expect_key = false;
      const auto end = path.find_first_of(".[", i);
      const auto key = path.substr(i, end == std::string_view::npos
                                          ? std::string_view::npos
                                          : end - i);
      if (key.empty()) {
        return std::unexpected("empty key at offset " + std::to_string(i) +
                               " in '" + std::string{path} + "'");
      }
      segments.emplace_back(std::string{key});
      i += key.size();
    } else if (c == '[') {
      const auto close = path.find(']', i);
      if (close == std::string_view::npos) {
        return std::unexpected("unclosed '[' in '" + std::string{path} + "'");
      }
      const auto digits = path.substr(i + 1, close - i - 1);
      std::size_t index = 0;
      auto [ptr, ec] =
          std::from_chars(digits.data(), digits.data() + digits.size(), index);
      if (digits.empty() || ec != std::errc{} ||
          ptr != digits.data() + digits.size()) {
        return std::unexpected("invalid index '" + std::string{digits} +
                               "' in '" + std::string{path} + "'");
      }
      segments.emplace_back(index);
      i = close + 1;
    } else {
      return std::unexpected("unexpected '" + std::string(1, c) + "' in '" +
                             std::string{path} + "'");
    }
  }

  return segments;
}

auto resolve_json_path(const nlohmann::json &doc,
                       const std::vector<PathSegment> &path)
    -> const nlohmann::json * {
  const nlohmann::json *node = &doc;
  for (const auto &seg : path) {
    node = std::visit(
        overloaded{
            [&](const std::string &key) -> const nlohmann::json * {
              if (!node->is_object()) {
                return nullptr;
              }
              auto it = node->find(key);
              return it == node->end() ? nullptr : &*it;
            },
            [&](std::size_t index) -> const nlohmann::json * {
              if (!node->is_array() || index >= node->size()) {
                return nullptr;
              }
              return &(*node)[index];
            },
        },
        seg);
    if (node == nullptr) {
      return nullptr;
    }
  }
  return node;
}

auto render_json_value(const nlohmann::json &value) -> std::string {
  if (value.is_string()) {
    return value.get<std::string>();
  }
  return value.dump();
}

auto extract(const Extractor &extractor, const HttpResponse &response)
    -> std::expected<std::string, ExtractionFailure> {
  return std::visit(
      overloaded{
          [&](const JsonPathExtractor &e) { return extract_json(e, response); },
          [&](const RegexExtractor &e) { return extract_regex(e, response); },
          [&](const HeaderExtractor &e) { return extract_header(e, response); },
          [&](const CookieExtractor &e) { return extract_cookie(e, response); },
      },
      extractor);
}

auto extract_variables(const std::vector<VariableExtraction> &extractions,
                       const HttpResponse &response, VariableContext &ctx)
    -> ExtractionReport {
  ExtractionReport report;
  for (const auto &ex : extractions) {
    auto value = extract(ex.extractor, response);
    if (value.has_value()) {
      ctx.set(ex.variable, std::move(*value));
      ++report.extracted;
    } else {
      auto f = std::move(value.error());
      f.variable = ex.variable;
      report.failures.push_back(std::move(f));
    }
  }
  return report;
}

} // namespace loadcurve
