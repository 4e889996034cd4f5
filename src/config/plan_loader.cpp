/// @file plan_loader.cpp
/// @brief Plan file parsing and validation.

#include "config/plan_loader.hpp"
#include "core/strings.hpp"

#include <charconv>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <memory>
#include <sstream>

namespace loadcurve {

using nlohmann::json;

namespace {

auto error(std::string field, std::string message)
    -> std::unexpected<ConfigError> {
  return std::unexpected(ConfigError{std::move(field), std::move(message)});
}

// ─── Typed field readers ────────────────────────────────────────────────

auto get_string(const json &obj, const std::string &key,
                const std::string &field)
    -> std::expected<std::optional<std::string>, ConfigError> {
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) {
    return std::optional<std::string>{};
  }
  if (!it->is_string()) {
    return error(field, "must be a string");
  }
  return std::optional<std::string>{it->get<std::string>()};
}

auto get_number(const json &obj, const std::string &key,
                const std::string &field)
    -> std::expected<std::optional<double>, ConfigError> {
  auto it = obj.find(key);
  if (it == obj.end() || it->is_null()) {
    return std::optional<double>{};
  }
  if (!it->is_number()) {
    return error(field, "must be a number");
  }
  return std::optional<double>{it->get<double>()};
}

auto require_number(const json &obj, const std::string &key,
                    const std::string &field)
    -> std::expected<double, ConfigError> {
  auto v = get_number(obj, key, field);
  if (!v) {
    return std::unexpected(v.error());
  }
  if (!v->has_value()) {
    return error(field, "is required");
  }
  return **v;
}

auto require_duration(const json &obj, const std::string &key,
                      const std::string &field)
    -> std::expected<Seconds, ConfigError> {
  auto it = obj.find(key);
  if (it == obj.end()) {
    return error(field, "is required");
  }
  return parse_duration(*it, field);
}

auto to_millis(Seconds s) -> std::chrono::milliseconds {
  return std::chrono::milliseconds{
      static_cast<std::int64_t>(std::llround(s.count() * 1000.0))};
}

// ─── Sections ───────────────────────────────────────────────────────────

auto parse_load(const json &j) -> std::expected<LoadModel, ConfigError> {
  if (!j.is_object()) {
    return error("load", "must be an object");
  }
  auto model_name = get_string(j, "model", "load.model");
  if (!model_name) {
    return std::unexpected(model_name.error());
  }
  const auto model = to_lower(model_name->value_or("concurrent"));

  if (model == "concurrent") {
    return ConcurrentModel{};
  }
  if (model == "rps") {
    auto target = require_number(j, "target", "load.target");
    if (!target) {
      return std::unexpected(target.error());
    }
    return RpsModel{*target};
  }
  if (model == "ramp" || model == "ramprps") {
    auto min = require_number(j, "min", "load.min");
    auto max = require_number(j, "max", "load.max");
    auto ramp = require_duration(j, "rampDuration", "load.rampDuration");
    if (!min) return std::unexpected(min.error());
    if (!max) return std::unexpected(max.error());
    if (!ramp) return std::unexpected(ramp.error());
    return RampRpsModel{.min = *min, .max = *max, .ramp_duration = *ramp};
  }
  if (model == "dailytraffic") {
    auto min = require_number(j, "min", "load.min");
    auto mid = require_number(j, "mid", "load.mid");
    auto max = require_number(j, "max", "load.max");
    auto cycle = require_duration(j, "cycleDuration", "load.cycleDuration");
    if (!min) return std::unexpected(min.error());
    if (!mid) return std::unexpected(mid.error());
    if (!max) return std::unexpected(max.error());
    if (!cycle) return std::unexpected(cycle.error());

    DailyTrafficModel daily{
        .min = *min, .mid = *mid, .max = *max, .cycle_duration = *cycle};
    if (auto it = j.find("ratios"); it != j.end()) {
      if (!it->is_array() || it->size() != daily.ratios.size()) {
        return error("load.ratios", "must be an array of five numbers");
      }
      for (std::size_t i = 0; i < daily.ratios.size(); ++i) {
        if (!(*it)[i].is_number()) {
          return error("load.ratios", "must be an array of five numbers");
        }
        daily.ratios[i] = (*it)[i].get<double>();
      }
    }
    return daily;
  }
  return error("load.model", "unknown model '" + model +
                                 "' (concurrent, rps, ramp, dailytraffic)");
}

auto parse_request(const json &j, const std::string &field)
    -> std::expected<RequestConfig, ConfigError> {
  if (!j.is_object()) {
    return error(field, "must be an object");
  }
  RequestConfig req;

  auto method = get_string(j, "method", field + ".method");
  if (!method) return std::unexpected(method.error());
  req.method = to_upper(method->value_or("GET"));

  auto path = get_string(j, "path", field + ".path");
  if (!path) return std::unexpected(path.error());
  if (!path->has_value()) {
    return error(field + ".path", "is required");
  }
  req.path = **path;

  if (auto it = j.find("body"); it != j.end() && !it->is_null()) {
    // Objects are sent as compact JSON text.
    req.body = it->is_string() ? it->get<std::string>() : it->dump();
  }

  if (auto it = j.find("headers"); it != j.end() && !it->is_null()) {
    if (!it->is_object()) {
      return error(field + ".headers", "must be an object");
    }
    for (const auto &[name, value] : it->items()) {
      if (!value.is_string()) {
        return error(field + ".headers." + name, "must be a string");
      }
      req.headers.emplace(name, value.get<std::string>());
    }
  }
  return req;
}

auto parse_extraction(const json &j, const std::string &field)
    -> std::expected<VariableExtraction, ConfigError> {
  if (!j.is_object()) {
    return error(field, "must be an object");
  }
  auto name = get_string(j, "name", field + ".name");
  if (!name) return std::unexpected(name.error());
  if (!name->has_value() || (*name)->empty()) {
    return error(field + ".name", "is required");
  }

  VariableExtraction ex{.variable = **name, .extractor = JsonPathExtractor{}};
  if (j.contains("jsonPath")) {
    auto p = get_string(j, "jsonPath", field + ".jsonPath");
    if (!p || !p->has_value()) {
      return error(field + ".jsonPath", "must be a string");
    }
    ex.extractor = JsonPathExtractor{**p};
  } else if (j.contains("regex")) {
    auto p = get_string(j, "regex", field + ".regex");
    if (!p || !p->has_value()) {
      return error(field + ".regex", "must be a string");
    }
    std::string group;
    if (auto it = j.find("group"); it != j.end()) {
      group = it->is_number_integer() ? std::to_string(it->get<int>())
              : it->is_string()        ? it->get<std::string>()
                                       : std::string{};
    }
    auto pattern = Pattern::compile(**p);
    if (!pattern) {
      return error(field + ".regex", "invalid regex " + pattern.error());
    }
    ex.extractor = RegexExtractor{std::move(*pattern), group};
  } else if (j.contains("header")) {
    auto p = get_string(j, "header", field + ".header");
    if (!p || !p->has_value()) {
      return error(field + ".header", "must be a string");
    }
    ex.extractor = HeaderExtractor{**p};
  } else if (j.contains("cookie")) {
    auto p = get_string(j, "cookie", field + ".cookie");
    if (!p || !p->has_value()) {
      return error(field + ".cookie", "must be a string");
    }
    ex.extractor = CookieExtractor{**p};
  } else {
    return error(field, "needs one of jsonPath, regex, header, cookie");
  }
  return ex;
}

auto parse_assertion(const json &j, const std::string &field)
    -> std::expected<Assertion, ConfigError> {
  if (!j.is_object()) {
    return error(field, "must be an object");
  }
  auto type = get_string(j, "type", field + ".type");
  if (!type) return std::unexpected(type.error());
  if (!type->has_value()) {
    return error(field + ".type", "is required");
  }
  const auto &t = **type;

  if (t == "statusCode") {
    auto code = require_number(j, "expected", field + ".expected");
    if (!code) return std::unexpected(code.error());
    if (*code < 100 || *code > 599) {
      return error(field + ".expected", "must be an HTTP status code");
    }
    return assertion::StatusCode{static_cast<std::uint16_t>(*code)};
  }
  if (t == "bodyContains") {
    auto text = get_string(j, "text", field + ".text");
    if (!text || !text->has_value()) {
      return error(field + ".text", "must be a string");
    }
    return assertion::BodyContains{**text};
  }
  if (t == "responseTime") {
    auto max = require_duration(j, "max", field + ".max");
    if (!max) return std::unexpected(max.error());
    return assertion::ResponseTime{to_millis(*max)};
  }
  if (t == "jsonPath") {
    auto path = get_string(j, "path", field + ".path");
    if (!path || !path->has_value()) {
      return error(field + ".path", "must be a string");
    }
    auto expected = get_string(j, "expected", field + ".expected");
    if (!expected) return std::unexpected(expected.error());
    return assertion::JsonPath{**path, *expected};
  }
  if (t == "bodyMatches") {
    auto re = get_string(j, "regex", field + ".regex");
    if (!re || !re->has_value()) {
      return error(field + ".regex", "must be a string");
    }
    auto pattern = Pattern::compile(**re);
    if (!pattern) {
      return error(field + ".regex", "invalid regex " + pattern.error());
    }
    return assertion::BodyMatches{std::move(*pattern)};
  }
  if (t == "headerExists") {
    auto h = get_string(j, "header", field + ".header");
    if (!h || !h->has_value()) {
      return error(field + ".header", "must be a string");
    }
    return assertion::HeaderExists{**h};
  }
  return error(field + ".type", "unknown assertion '" + t + "'");
}

auto parse_think_time(const json &j, const std::string &field)
    -> std::expected<ThinkTime, ConfigError> {
  if (j.is_object()) {
    auto min = require_duration(j, "min", field + ".min");
    auto max = require_duration(j, "max", field + ".max");
    if (!min) return std::unexpected(min.error());
    if (!max) return std::unexpected(max.error());
    if (*min > *max) {
      return error(field, "min must not exceed max");
    }
    return RandomThinkTime{to_millis(*min), to_millis(*max)};
  }
  auto fixed = parse_duration(j, field);
  if (!fixed) return std::unexpected(fixed.error());
  return FixedThinkTime{to_millis(*fixed)};
}

auto parse_step(const json &j, const std::string &field)
    -> std::expected<Step, ConfigError> {
  if (!j.is_object()) {
    return error(field, "must be an object");
  }
  Step step;
  auto name = get_string(j, "name", field + ".name");
  if (!name) return std::unexpected(name.error());
  step.name = name->value_or(field);

  auto it = j.find("request");
  if (it == j.end()) {
    return error(field + ".request", "is required");
  }
  auto req = parse_request(*it, field + ".request");
  if (!req) return std::unexpected(req.error());
  step.request = std::move(*req);

  if (auto ex = j.find("extract"); ex != j.end()) {
    if (!ex->is_array()) {
      return error(field + ".extract", "must be an array");
    }
    for (std::size_t i = 0; i < ex->size(); ++i) {
      auto e = parse_extraction((*ex)[i],
                                field + ".extract[" + std::to_string(i) + "]");
      if (!e) return std::unexpected(e.error());
      step.extractions.push_back(std::move(*e));
    }
  }

  if (auto as = j.find("assertions"); as != j.end()) {
    if (!as->is_array()) {
      return error(field + ".assertions", "must be an array");
    }
    for (std::size_t i = 0; i < as->size(); ++i) {
      auto a = parse_assertion(
          (*as)[i], field + ".assertions[" + std::to_string(i) + "]");
      if (!a) return std::unexpected(a.error());
      step.assertions.push_back(std::move(*a));
    }
  }

  if (auto tt = j.find("thinkTime"); tt != j.end() && !tt->is_null()) {
    auto think = parse_think_time(*tt, field + ".thinkTime");
    if (!think) return std::unexpected(think.error());
    step.think_time = *think;
  }

  if (auto c = j.find("cache"); c != j.end() && !c->is_null()) {
    step.cache = CacheDirective{c->dump()};
  }
  return step;
}

auto parse_scenario(const json &j, const std::string &field,
                    const std::filesystem::path &base_dir)
    -> std::expected<ScenarioPtr, ConfigError> {
  if (!j.is_object()) {
    return error(field, "must be an object");
  }
  auto scenario = std::make_shared<Scenario>();

  auto name = get_string(j, "name", field + ".name");
  if (!name) return std::unexpected(name.error());
  if (!name->has_value() || (*name)->empty()) {
    return error(field + ".name", "is required");
  }
  scenario->name = **name;

  auto weight = get_number(j, "weight", field + ".weight");
  if (!weight) return std::unexpected(weight.error());
  scenario->weight = weight->value_or(1.0);

  auto steps = j.find("steps");
  if (steps == j.end() || !steps->is_array() || steps->empty()) {
    return error(field + ".steps", "must be a non-empty array");
  }
  for (std::size_t i = 0; i < steps->size(); ++i) {
    auto step =
        parse_step((*steps)[i], field + ".steps[" + std::to_string(i) + "]");
    if (!step) return std::unexpected(step.error());
    scenario->steps.push_back(std::move(*step));
  }

  auto data_file = get_string(j, "dataFile", field + ".dataFile");
  if (!data_file) return std::unexpected(data_file.error());
  if (data_file->has_value()) {
    std::filesystem::path p{**data_file};
    if (p.is_relative()) {
      p = base_dir / p;
    }
    auto data = DataSource::from_file(p);
    if (!data) {
      const auto &e = data.error();
      return error(field + ".dataFile",
                   e.message + (e.line > 0
                                    ? " (line " + std::to_string(e.line) + ")"
                                    : std::string{}));
    }
    scenario->data = std::make_shared<const DataSource>(std::move(*data));
  }

  return ScenarioPtr{std::move(scenario)};
}

auto parse_guard(const json &j, MemoryGuardConfig &cfg)
    -> std::expected<void, ConfigError> {
  if (!j.is_object()) {
    return error("memoryGuard", "must be an object");
  }
  auto warn = get_number(j, "warningPercent", "memoryGuard.warningPercent");
  auto crit = get_number(j, "criticalPercent", "memoryGuard.criticalPercent");
  if (!warn) return std::unexpected(warn.error());
  if (!crit) return std::unexpected(crit.error());
  cfg.warning_percent = warn->value_or(cfg.warning_percent);
  cfg.critical_percent = crit->value_or(cfg.critical_percent);

  if (auto it = j.find("interval"); it != j.end()) {
    auto interval = parse_duration(*it, "memoryGuard.interval");
    if (!interval) return std::unexpected(interval.error());
    cfg.interval = to_millis(*interval);
  }
  if (auto it = j.find("autoDisable"); it != j.end()) {
    if (!it->is_boolean()) {
      return error("memoryGuard.autoDisable", "must be a boolean");
    }
    cfg.auto_disable = it->get<bool>();
  }

  if (cfg.warning_percent <= 0.0 || cfg.critical_percent <= 0.0) {
    return error("memoryGuard", "thresholds must be > 0");
  }
  if (cfg.warning_percent > cfg.critical_percent) {
    return error("memoryGuard.warningPercent",
                 "must not exceed criticalPercent");
  }
  if (cfg.interval.count() <= 0) {
    return error("memoryGuard.interval", "must be > 0");
  }
  return {};
}

auto parse_global(const json &j, RunPlan &plan)
    -> std::expected<void, ConfigError> {
  if (!j.is_object()) {
    return error("config", "must be an object");
  }
  auto base = get_string(j, "baseUrl", "config.baseUrl");
  if (!base) return std::unexpected(base.error());
  if (base->has_value()) {
    plan.base_url = **base;
  }

  auto workers = get_number(j, "workers", "config.workers");
  if (!workers) return std::unexpected(workers.error());
  if (workers->has_value()) {
    if (**workers < 1 || std::floor(**workers) != **workers) {
      return error("config.workers", "must be a positive integer");
    }
    plan.workers = static_cast<std::size_t>(**workers);
  }

  if (auto it = j.find("duration"); it != j.end()) {
    auto d = parse_duration(*it, "config.duration");
    if (!d) return std::unexpected(d.error());
    plan.duration = *d;
  }
  if (auto it = j.find("timeout"); it != j.end()) {
    auto t = parse_duration(*it, "config.timeout");
    if (!t) return std::unexpected(t.error());
    plan.request_timeout = to_millis(*t);
  }

  auto sampling = get_number(j, "samplingRate", "config.samplingRate");
  if (!sampling) return std::unexpected(sampling.error());
  if (sampling->has_value()) {
    if (**sampling < 1 || **sampling > 100) {
      return error("config.samplingRate", "must be between 1 and 100");
    }
    plan.sampling_rate = static_cast<unsigned>(**sampling);
  }

  if (auto it = j.find("percentiles"); it != j.end()) {
    if (!it->is_boolean()) {
      return error("config.percentiles", "must be a boolean");
    }
    plan.percentiles = it->get<bool>();
  }
  return {};
}

} // namespace

// ─── Durations ──────────────────────────────────────────────────────────

auto parse_duration(std::string_view text)
    -> std::expected<Seconds, ConfigError> {
  auto s = trim(text);
  if (s.empty()) {
    return error("duration", "is empty");
  }

  double scale = 1.0;
  if (s.ends_with("ms")) {
    scale = 0.001;
    s.remove_suffix(2);
  } else {
    switch (s.back()) {
    case 's':
      s.remove_suffix(1);
      break;
    case 'm':
      scale = 60.0;
      s.remove_suffix(1);
      break;
    case 'h':
      scale = 3600.0;
      s.remove_suffix(1);
      break;
    case 'd':
      scale = 86400.0;
      s.remove_suffix(1);
      break;
    default:
      break;
    }
  }

  double value = 0.0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
  if (s.empty() || ec != std::errc{} || ptr != s.data() + s.size()) {
    return error("duration", "invalid duration '" + std::string{text} +
                                 "' (use e.g. 30, 30s, 500ms, 10m, 2h, 1d)");
  }
  if (value < 0.0) {
    return error("duration", "must be non-negative");
  }
  return Seconds{value * scale};
}

auto parse_duration(const json &value, const std::string &field)
    -> std::expected<Seconds, ConfigError> {
  if (value.is_number()) {
    const double secs = value.get<double>();
    if (secs < 0.0 || std::isnan(secs)) {
      return error(field, "must be non-negative");
    }
    return Seconds{secs};
  }
  if (value.is_string()) {
    auto d = parse_duration(value.get<std::string>());
    if (!d) {
      return error(field, d.error().message);
    }
    return d;
  }
  return error(field, "must be a number of seconds or a duration string");
}

// ─── Plans ──────────────────────────────────────────────────────────────

auto plan_from_json(const json &doc, const std::filesystem::path &base_dir)
    -> std::expected<LoadedPlan, ConfigError> {
  if (!doc.is_object()) {
    return error("", "plan must be a JSON object");
  }

  LoadedPlan loaded;
  auto &plan = loaded.plan;

  try {
    if (auto it = doc.find("config"); it != doc.end()) {
      if (auto r = parse_global(*it, plan); !r) {
        return std::unexpected(r.error());
      }
    }

    if (auto it = doc.find("load"); it != doc.end()) {
      auto load = parse_load(*it);
      if (!load) return std::unexpected(load.error());
      plan.load = *load;
    }
    auto warnings = validate(plan.load);
    if (!warnings) {
      return std::unexpected(warnings.error());
    }
    loaded.warnings = std::move(*warnings);

    if (auto it = doc.find("memoryGuard"); it != doc.end()) {
      if (auto r = parse_guard(*it, plan.guard); !r) {
        return std::unexpected(r.error());
      }
    }

    if (auto it = doc.find("request"); it != doc.end() && !it->is_null()) {
      auto req = parse_request(*it, "request");
      if (!req) return std::unexpected(req.error());
      plan.request = std::move(*req);
    }

    if (auto it = doc.find("scenarios"); it != doc.end()) {
      if (!it->is_array()) {
        return error("scenarios", "must be an array");
      }
      std::vector<ScenarioPtr> scenarios;
      for (std::size_t i = 0; i < it->size(); ++i) {
        auto s = parse_scenario((*it)[i],
                                "scenarios[" + std::to_string(i) + "]",
                                base_dir);
        if (!s) return std::unexpected(s.error());
        scenarios.push_back(std::move(*s));
      }
      if (!scenarios.empty()) {
        auto selector = ScenarioSelector::create(std::move(scenarios));
        if (!selector) return std::unexpected(selector.error());
        plan.selector = std::move(*selector);
      }
    }
  } catch (const json::exception &e) {
    return error("", std::string{"malformed plan: "} + e.what());
  }

  if (!plan.request && !plan.selector) {
    return error("request", "plan needs a request or at least one scenario");
  }
  if (plan.request && plan.selector) {
    loaded.warnings.emplace_back(
        "both request and scenarios are set; scenarios are used");
  }
  if (plan.base_url.empty()) {
    return error("config.baseUrl", "is required");
  }
  return loaded;
}

auto load_plan_string(std::string_view text,
                      const std::filesystem::path &base_dir)
    -> std::expected<LoadedPlan, ConfigError> {
  auto doc = json::parse(text, nullptr, /*allow_exceptions=*/false,
                         /*ignore_comments=*/true);
  if (doc.is_discarded()) {
    return error("", "plan is not valid JSON");
  }
  return plan_from_json(doc, base_dir);
}

auto load_plan_file(const std::filesystem::path &path)
    -> std::expected<LoadedPlan, ConfigError> {
  std::ifstream file(path);
  if (!file) {
    return error("plan", "cannot open " + path.string());
  }
  std::ostringstream ss;
  ss << file.rdbuf();
  return load_plan_string(ss.str(), path.parent_path().empty()
                                        ? std::filesystem::path{"."}
                                        : path.parent_path());
}

} // namespace loadcurve
