#include "quotaguard/price_catalog.hpp"
#include "quotaguard/exceptions.hpp"
#include "quotaguard/monitor.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <istream>

namespace quotaguard {

namespace {

constexpr std::size_t CSV_FIELD_COUNT = 5;

bool is_blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(),
        [](unsigned char c) { return std::isspace(c); });
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() &&
           s.compare(0, prefix.size(), prefix) == 0;
}

} // anonymous namespace

std::vector<std::string> split_csv_line(const std::string& line) {
    std::vector<std::string> fields;
    std::string field;
    bool in_quotes = false;

    for (std::size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (in_quotes) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') {
                    field += '"';
                    ++i;
                } else {
                    in_quotes = false;
                }
            } else {
                field += c;
            }
        } else if (c == '"') {
            in_quotes = true;
        } else if (c == ',') {
            fields.push_back(std::move(field));
            field.clear();
        } else {
            field += c;
        }
    }
    fields.push_back(std::move(field));
    return fields;
}

// Padding is not stripped: " 2.5" is rejected like any other malformed number
std::optional<double> parse_rate(const std::string& s) {
    if (s.empty()) {
        return 0.0;
    }

    errno = 0;
    char* end = nullptr;
    double value = std::strtod(s.c_str(), &end);
    if (end != s.c_str() + s.size() || errno == ERANGE) {
        return std::nullopt;
    }
    if (!std::isfinite(value) || value < 0.0) {
        return std::nullopt;
    }
    return value;
}

// ==================== PriceCatalog ====================

PriceCatalog::PriceCatalog(PriceEntry default_entry)
    : default_entry_(std::move(default_entry))
{}

PriceCatalog PriceCatalog::from_csv(std::istream& in,
                                    const std::string& source_name,
                                    PriceEntry default_entry,
                                    CatalogLoadReport* report)
{
    // Collect non-blank records with their 1-based line numbers
    std::vector<std::pair<std::size_t, std::string>> records;
    std::string line;
    std::size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (is_blank(line)) continue;
        records.emplace_back(line_no, line);
    }

    if (in.bad()) {
        throw PricingLoadException(source_name, "error reading CSV");
    }
    if (records.size() < 2) {
        throw PricingLoadException(source_name,
            "CSV file must contain at least header and one data row");
    }

    PriceCatalog catalog(std::move(default_entry));
    CatalogLoadReport local_report;
    local_report.records = records.size();

    // Skip the header
    for (std::size_t i = 1; i < records.size(); ++i) {
        auto& [number, text] = records[i];
        auto fields = split_csv_line(text);

        if (fields.size() < CSV_FIELD_COUNT) {
            local_report.skipped.push_back(
                {number, fields.empty() ? std::string() : fields[0],
                 "incomplete row: " + std::to_string(fields.size()) + " fields"});
            continue;
        }

        const std::string& model = fields[0];
        const std::string& version = fields[1];

        auto input = parse_rate(fields[2]);
        if (!input) {
            local_report.skipped.push_back(
                {number, model, "invalid input price '" + fields[2] + "'"});
            continue;
        }

        // Optional column: empty or unparsable means zero
        double cached_input = parse_rate(fields[3]).value_or(0.0);

        auto output = parse_rate(fields[4]);
        if (!output) {
            local_report.skipped.push_back(
                {number, model, "invalid output price '" + fields[4] + "'"});
            continue;
        }

        catalog.insert(PriceEntry{model, version, *input, cached_input, *output});
        local_report.rows_loaded++;
    }

    if (report) {
        *report = std::move(local_report);
    }
    return catalog;
}

PriceCatalog PriceCatalog::from_csv_file(const std::string& path,
                                         PriceEntry default_entry,
                                         CatalogLoadReport* report)
{
    std::ifstream file(path);
    if (!file.is_open()) {
        throw PricingLoadException(path, "cannot open pricing file");
    }
    return from_csv(file, path, std::move(default_entry), report);
}

void PriceCatalog::insert(const PriceEntry& entry) {
    entries_[entry.model_key] = entry;
    if (!entry.version.empty() && entry.version != entry.model_key) {
        entries_[entry.version] = entry;
    }
}

PriceResolution PriceCatalog::resolve(const std::string& model) const {
    auto it = entries_.find(model);
    if (it != entries_.end()) {
        return {it->second, true};
    }

    // First prefix hit wins; iteration order of the map decides
    for (auto& [key, entry] : entries_) {
        if (starts_with(model, key)) {
            return {entry, true};
        }
    }

    return {default_entry_, false};
}

bool PriceCatalog::contains(const std::string& key) const {
    return entries_.count(key) > 0;
}

std::size_t PriceCatalog::size() const noexcept { return entries_.size(); }
bool PriceCatalog::empty() const noexcept { return entries_.empty(); }

std::vector<std::string> PriceCatalog::keys() const {
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (auto& [key, _] : entries_) {
        result.push_back(key);
    }
    std::sort(result.begin(), result.end());
    return result;
}

const PricingTable& PriceCatalog::entries() const noexcept { return entries_; }
const PriceEntry& PriceCatalog::default_entry() const noexcept { return default_entry_; }

// ==================== Startup loader ====================

std::shared_ptr<const PriceCatalog> load_price_catalog(
    const Config& config,
    const std::shared_ptr<Monitor>& monitor)
{
    auto emit = [&monitor](MonitorEvent event) {
        if (!monitor) return;
        event.timestamp = Clock::now();
        monitor->on_event(event);
    };

    CatalogLoadReport report;
    try {
        auto catalog = PriceCatalog::from_csv_file(
            config.pricing_path, config.default_price, &report);

        for (auto& row : report.skipped) {
            MonitorEvent ev{EventType::PricingRowSkipped, {}, "Skipping row: " + row.reason};
            if (!row.model.empty()) ev.model = row.model;
            ev.line = row.line;
            emit(std::move(ev));
        }
        emit(MonitorEvent{EventType::PricingLoaded, {},
            "Loaded pricing for " + std::to_string(catalog.size()) +
            " models from " + config.pricing_path});

        return std::make_shared<const PriceCatalog>(std::move(catalog));
    } catch (const PricingLoadException& e) {
        emit(MonitorEvent{EventType::PricingLoadFailed, {},
            std::string(e.what()) + "; using default pricing for models"});
        return std::make_shared<const PriceCatalog>(config.default_price);
    }
}

} // namespace quotaguard
