#pragma once

#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace geofacet
{

using OptionValue = std::variant<bool, double, std::string>;

// Names understood by Axes::apply(). Anything else is kept on the Axes as an
// extra attribute for the render callback to interpret.
namespace option_keys
{
inline constexpr std::string_view title              = "title";
inline constexpr std::string_view xlabel             = "xlabel";
inline constexpr std::string_view ylabel             = "ylabel";
inline constexpr std::string_view grid               = "grid";
inline constexpr std::string_view border             = "border";
inline constexpr std::string_view xmin               = "xmin";
inline constexpr std::string_view xmax               = "xmax";
inline constexpr std::string_view ymin               = "ymin";
inline constexpr std::string_view ymax               = "ymax";
inline constexpr std::string_view xticksvisible      = "xticksvisible";
inline constexpr std::string_view xticklabelsvisible = "xticklabelsvisible";
inline constexpr std::string_view xlabelvisible      = "xlabelvisible";
inline constexpr std::string_view yticksvisible      = "yticksvisible";
inline constexpr std::string_view yticklabelsvisible = "yticklabelsvisible";
inline constexpr std::string_view ylabelvisible      = "ylabelvisible";
inline constexpr std::string_view yaxisposition      = "yaxisposition";
}   // namespace option_keys

// Insertion-ordered option map. Values are copied on merge; an AxisOptions
// handed to a render callback is never shared with another axis.
class AxisOptions
{
   public:
    using Entry          = std::pair<std::string, OptionValue>;
    using const_iterator = std::vector<Entry>::const_iterator;

    AxisOptions() = default;
    AxisOptions(std::initializer_list<Entry> entries);

    // Overwrites in place when the key exists, otherwise appends.
    AxisOptions& set(std::string_view key, OptionValue value);
    AxisOptions& set(std::string_view key, bool value) { return set(key, OptionValue(value)); }
    AxisOptions& set(std::string_view key, double value) { return set(key, OptionValue(value)); }
    AxisOptions& set(std::string_view key, int value) { return set(key, OptionValue(static_cast<double>(value))); }
    AxisOptions& set(std::string_view key, std::string value) { return set(key, OptionValue(std::move(value))); }
    AxisOptions& set(std::string_view key, const char* value) { return set(key, OptionValue(std::string(value))); }

    bool               contains(std::string_view key) const { return find(key) != nullptr; }
    const OptionValue* find(std::string_view key) const;
    bool               erase(std::string_view key);

    std::optional<bool>        get_bool(std::string_view key) const;
    std::optional<double>      get_number(std::string_view key) const;
    std::optional<std::string> get_string(std::string_view key) const;

    size_t         size() const { return entries_.size(); }
    bool           empty() const { return entries_.empty(); }
    const_iterator begin() const { return entries_.begin(); }
    const_iterator end() const { return entries_.end(); }

    // Copy of *this with every entry of `overlay` applied on top. Existing
    // keys keep their position, new keys are appended.
    AxisOptions merged(const AxisOptions& overlay) const;

    bool operator==(const AxisOptions&) const = default;

   private:
    std::vector<Entry> entries_;
};

std::string to_string(const OptionValue& value);

}   // namespace geofacet
