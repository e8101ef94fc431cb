#include "features/feature_builder.hpp"
#include "core/error.hpp"
#include "core/stats.hpp"
#include "core/utils.hpp"

#include <cctype>
#include <charconv>
#include <cmath>
#include <format>
#include <unordered_map>
#include <unordered_set>

namespace auditfusion {

namespace {

std::optional<double> numeric_value(const FieldValue& v) {
    if (const auto* d = std::get_if<double>(&v)) {
        if (!std::isfinite(*d)) return std::nullopt;
        return *d;
    }
    if (const auto* b = std::get_if<bool>(&v)) {
        return *b ? 1.0 : 0.0;
    }
    return std::nullopt;
}

std::optional<std::string> text_value(const FieldValue& v) {
    if (const auto* s = std::get_if<std::string>(&v)) return *s;
    if (const auto* d = std::get_if<double>(&v)) return std::format("{}", *d);
    if (const auto* b = std::get_if<bool>(&v)) return std::string(*b ? "true" : "false");
    return std::nullopt;
}

/// Monetary text such as "1,200.00" or "+35"; nullopt unless the whole string is a number
std::optional<double> parse_amount(const std::string& text) {
    std::string digits;
    digits.reserve(text.size());
    for (const char c : utils::trim(text)) {
        if (c != ',') digits += c;
    }
    if (!digits.empty() && digits.front() == '+') digits.erase(0, 1);
    if (digits.empty()) return std::nullopt;

    double value = 0.0;
    const char* end = digits.data() + digits.size();
    const auto [ptr, ec] = std::from_chars(digits.data(), end, value);
    if (ec != std::errc{} || ptr != end || !std::isfinite(value)) return std::nullopt;
    return value;
}

std::optional<double> amount_value(const FieldValue& v) {
    if (auto d = numeric_value(v)) return d;
    if (const auto* s = std::get_if<std::string>(&v)) return parse_amount(*s);
    return std::nullopt;
}

const FieldValue* find_field(const Record& record, const std::string& name) {
    const auto it = record.find(name);
    return (it != record.end()) ? &it->second : nullptr;
}

/// Fill missing entries with the median of the present ones (0 if none present)
std::vector<double> impute_median(const std::vector<std::optional<double>>& column) {
    std::vector<double> present;
    present.reserve(column.size());
    for (const auto& v : column) {
        if (v) present.push_back(*v);
    }
    const double fill = stats::median(present);

    std::vector<double> result;
    result.reserve(column.size());
    for (const auto& v : column) {
        result.push_back(v.value_or(fill));
    }
    return result;
}

double finite_or_zero(double v) {
    return std::isfinite(v) ? v : 0.0;
}

} // anonymous namespace

FeatureBuilder::FeatureBuilder(Config config)
    : config_(std::move(config)) {}

std::optional<std::chrono::year_month_day> FeatureBuilder::parse_date(const std::string& text) {
    const std::string s = utils::trim(text);
    if (s.size() < 10) return std::nullopt;

    const char sep = s[4];
    if ((sep != '-' && sep != '/') || s[7] != sep) return std::nullopt;
    for (const size_t i : {0, 1, 2, 3, 5, 6, 8, 9}) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return std::nullopt;
    }
    if (s.size() > 10 && s[10] != 'T' && s[10] != ' ') return std::nullopt;

    const int y = std::stoi(s.substr(0, 4));
    const unsigned m = static_cast<unsigned>(std::stoi(s.substr(5, 2)));
    const unsigned d = static_cast<unsigned>(std::stoi(s.substr(8, 2)));

    const std::chrono::year_month_day ymd{
        std::chrono::year{y}, std::chrono::month{m}, std::chrono::day{d}};
    if (!ymd.ok()) return std::nullopt;
    return ymd;
}

std::string FeatureBuilder::record_id_of(const Record& record, size_t index) const {
    const auto* v = find_field(record, config_.id_field);
    if (v) {
        if (const auto* d = std::get_if<double>(v)) {
            // Integral ids print without a fractional part
            if (std::isfinite(*d) && std::floor(*d) == *d) {
                return std::format("{}", static_cast<long long>(*d));
            }
        }
        if (auto t = text_value(*v)) return *t;
    }
    return std::to_string(index);
}

std::vector<FeatureBuilder::FieldPlan> FeatureBuilder::plan_fields(
    const std::vector<Record>& records) const {

    std::vector<std::string> order;
    std::unordered_set<std::string> seen;
    for (const auto& record : records) {
        for (const auto& [name, value] : record) {
            if (name.empty() || name.front() == '_' || name == config_.id_field) continue;
            if (seen.insert(name).second) {
                order.push_back(name);
            }
        }
    }

    std::vector<FieldPlan> plans;
    plans.reserve(order.size());

    for (const auto& name : order) {
        bool any_present = false;
        bool all_numeric = true;
        bool any_date = false;
        const bool date_like_name = utils::contains_any(name, config_.date_keywords);

        for (const auto& record : records) {
            const auto* v = find_field(record, name);
            if (!v || is_missing(*v)) continue;
            any_present = true;
            if (!is_numeric(*v)) all_numeric = false;
            if (date_like_name && !any_date) {
                if (const auto* s = std::get_if<std::string>(v)) {
                    any_date = parse_date(*s).has_value();
                }
            }
        }

        if (!any_present) {
            utils::log::debug(std::format("FeatureBuilder: field '{}' has no values, skipped", name));
            continue;
        }

        FieldPlan plan;
        plan.name = name;
        plan.monetary = utils::contains_any(name, config_.amount_keywords);
        if (all_numeric) {
            plan.kind = FieldKind::NUMERIC;
        } else if (any_date) {
            plan.kind = FieldKind::DATE;
        } else {
            plan.kind = FieldKind::TEXT;
        }
        plans.push_back(std::move(plan));
    }
    return plans;
}

FeatureBatch FeatureBuilder::build(const std::vector<Record>& records) const {
    if (records.empty()) return {};

    const size_t n = records.size();

    // Record identity must be unique within the batch
    std::vector<std::string> ids;
    ids.reserve(n);
    std::unordered_set<std::string> id_set;
    for (size_t i = 0; i < n; ++i) {
        ids.push_back(record_id_of(records[i], i));
        if (!id_set.insert(ids.back()).second) {
            throw FeatureExtractionError(
                std::format("Duplicate record id '{}' at index {}", ids.back(), i));
        }
    }

    const auto plans = plan_fields(records);
    if (plans.empty()) return {};

    auto schema = std::make_shared<FeatureSchema>();
    std::vector<std::vector<double>> columns;

    auto add_column = [&](std::string name, FeatureInfo info, std::vector<double> column) {
        for (auto& v : column) v = finite_or_zero(v);
        schema->add(std::move(name), std::move(info));
        columns.push_back(std::move(column));
    };

    // ---- 1. Raw numerics -------------------------------------------------
    std::unordered_map<std::string, std::vector<double>> numeric_columns;
    std::vector<std::map<std::string, double>> amounts(n);
    for (const auto& plan : plans) {
        if (plan.kind != FieldKind::NUMERIC) continue;
        std::vector<std::optional<double>> raw(n);
        for (size_t i = 0; i < n; ++i) {
            if (const auto* v = find_field(records[i], plan.name)) {
                raw[i] = numeric_value(*v);
            }
            if (plan.monetary && raw[i]) amounts[i][plan.name] = *raw[i];
        }
        auto column = impute_median(raw);
        numeric_columns[plan.name] = column;
        add_column(plan.name, {plan.name, FeatureRole::RAW_NUMERIC, plan.monetary},
                   std::move(column));
    }

    // Monetary fields with mixed value types still feed the rule checks
    for (const auto& plan : plans) {
        if (plan.kind == FieldKind::NUMERIC || !plan.monetary) continue;
        for (size_t i = 0; i < n; ++i) {
            const auto* v = find_field(records[i], plan.name);
            if (!v) continue;
            if (const auto amount = amount_value(*v)) amounts[i][plan.name] = *amount;
        }
    }

    // ---- 2. Monetary derivations ------------------------------------------
    for (const auto& plan : plans) {
        if (plan.kind != FieldKind::NUMERIC || !plan.monetary) continue;
        const auto& values = numeric_columns.at(plan.name);

        std::vector<double> log_col(n);
        for (size_t i = 0; i < n; ++i) {
            log_col[i] = std::log1p(std::abs(values[i]));
        }

        const double mean = stats::mean(values);
        const double sd = stats::sample_stddev(values);
        std::vector<double> z_col(n, 0.0);
        if (sd > 0.0) {
            for (size_t i = 0; i < n; ++i) {
                z_col[i] = std::abs((values[i] - mean) / sd);
            }
        }

        add_column(plan.name + "_log", {plan.name, FeatureRole::AMOUNT_LOG, true}, std::move(log_col));
        add_column(plan.name + "_zscore", {plan.name, FeatureRole::AMOUNT_ZSCORE, true}, std::move(z_col));
        add_column(plan.name + "_percentile", {plan.name, FeatureRole::AMOUNT_PERCENTILE, true},
                   stats::percentile_ranks(values));
    }

    // ---- 3. Date derivations ----------------------------------------------
    for (const auto& plan : plans) {
        if (plan.kind != FieldKind::DATE) continue;

        std::vector<std::optional<std::chrono::year_month_day>> dates(n);
        for (size_t i = 0; i < n; ++i) {
            if (const auto* v = find_field(records[i], plan.name)) {
                if (const auto* s = std::get_if<std::string>(v)) {
                    dates[i] = parse_date(*s);
                }
            }
        }

        std::vector<std::optional<double>> year(n), month(n), day(n), weekday(n), quarter(n);
        for (size_t i = 0; i < n; ++i) {
            if (!dates[i]) continue;
            const auto& ymd = *dates[i];
            const unsigned m = static_cast<unsigned>(ymd.month());
            year[i] = static_cast<double>(static_cast<int>(ymd.year()));
            month[i] = static_cast<double>(m);
            day[i] = static_cast<double>(static_cast<unsigned>(ymd.day()));
            // iso_encoding: Monday = 1 .. Sunday = 7
            const std::chrono::weekday wd{std::chrono::sys_days{ymd}};
            weekday[i] = static_cast<double>(wd.iso_encoding() - 1);
            quarter[i] = static_cast<double>((m - 1) / 3 + 1);
        }

        const auto& f = plan.name;
        add_column(f + "_year", {f, FeatureRole::DATE_YEAR, false}, impute_median(year));
        add_column(f + "_month", {f, FeatureRole::DATE_MONTH, false}, impute_median(month));
        add_column(f + "_day", {f, FeatureRole::DATE_DAY, false}, impute_median(day));
        add_column(f + "_weekday", {f, FeatureRole::DATE_WEEKDAY, false}, impute_median(weekday));
        add_column(f + "_quarter", {f, FeatureRole::DATE_QUARTER, false}, impute_median(quarter));

        if (n > 1) {
            std::vector<double> delta(n, 0.0);
            for (size_t i = 1; i < n; ++i) {
                if (dates[i] && dates[i - 1]) {
                    const auto diff = std::chrono::sys_days{*dates[i]} -
                                      std::chrono::sys_days{*dates[i - 1]};
                    delta[i] = static_cast<double>(diff.count());
                }
            }
            add_column(f + "_time_diff", {f, FeatureRole::DATE_DELTA, false}, std::move(delta));
        }
    }

    // ---- 4. Text encodings ------------------------------------------------
    std::vector<std::map<std::string, std::string>> attributes(n);
    for (const auto& plan : plans) {
        if (plan.kind == FieldKind::NUMERIC) continue;

        std::vector<std::string> values(n, config_.unknown_token);
        for (size_t i = 0; i < n; ++i) {
            if (const auto* v = find_field(records[i], plan.name)) {
                if (auto t = text_value(*v)) values[i] = std::move(*t);
            }
            attributes[i][plan.name] = values[i];
        }
        if (plan.kind == FieldKind::DATE) continue;

        std::unordered_map<std::string, size_t> counts;
        std::unordered_map<std::string, size_t> labels;
        for (const auto& v : values) {
            ++counts[v];
            labels.try_emplace(v, labels.size());
        }

        std::vector<double> freq_col(n), label_col(n);
        for (size_t i = 0; i < n; ++i) {
            freq_col[i] = static_cast<double>(counts[values[i]]);
            label_col[i] = static_cast<double>(labels[values[i]]);
        }
        add_column(plan.name + "_frequency", {plan.name, FeatureRole::CATEGORY_FREQUENCY, false},
                   std::move(freq_col));
        add_column(plan.name + "_label", {plan.name, FeatureRole::CATEGORY_LABEL, false},
                   std::move(label_col));
    }

    if (schema->size() == 0) return {};

    // ---- Assemble row vectors -----------------------------------------------
    FeatureBatch batch;
    batch.schema = schema;
    batch.vectors.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        FeatureVector fv;
        fv.record_id = ids[i];
        fv.record_index = i;
        fv.schema = schema;
        fv.values.reserve(columns.size());
        for (const auto& col : columns) {
            fv.values.push_back(col[i]);
        }
        fv.attributes = std::move(attributes[i]);
        fv.amounts = std::move(amounts[i]);
        batch.vectors.push_back(std::move(fv));
    }

    utils::log::debug(std::format("FeatureBuilder: {} records -> {} features",
        n, schema->size()));
    return batch;
}

} // namespace auditfusion
