#include <rangewatch/registry/breakpoint_tools.h>
#include <rangewatch/util/errors.h>
#include <rangewatch/util/string_map.h>

#include <cctype>

namespace rangewatch {
    std::string derive_suffix(std::string_view alias) {
        std::string suffix;
        suffix.reserve(alias.size());
        bool segment_start{true};
        for (char c : alias) {
            auto uc = static_cast<unsigned char>(c);
            if (!std::isalnum(uc)) {
                segment_start = true;
                continue;
            }
            suffix.push_back(segment_start ? static_cast<char>(std::toupper(uc)) : c);
            segment_start = false;
        }
        return suffix;
    }

    RangeDefinitions validate_suffixes(RangeDefinitions ranges) {
        for (auto &range : ranges) {
            if (!range.suffix.empty()) { continue; }
            range.suffix = derive_suffix(range.alias);
            if (range.suffix.empty()) {
                throw_error<ConfigurationError>("Cannot derive a suffix for alias '{}' (query '{}')", range.alias,
                                                range.query);
            }
        }
        return ranges;
    }

    RangeDefinitions merge_by_alias(const RangeDefinitions &defaults, const RangeDefinitions &custom) {
        RangeDefinitions candidates;
        candidates.reserve(defaults.size() + custom.size());
        candidates.insert(candidates.end(), defaults.begin(), defaults.end());
        candidates.insert(candidates.end(), custom.begin(), custom.end());
        candidates = validate_suffixes(std::move(candidates));

        RangeDefinitions merged;
        merged.reserve(candidates.size());
        StringMap<std::size_t> positions;
        for (auto &range : candidates) {
            auto [it, inserted] = positions.try_emplace(range.alias, merged.size());
            if (inserted) {
                merged.push_back(std::move(range));
            } else {
                merged[it->second] = std::move(range);
            }
        }
        return merged;
    }
} // namespace rangewatch
