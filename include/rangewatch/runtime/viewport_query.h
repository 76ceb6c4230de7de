#pragma once

/**
 * @file viewport_query.h
 * @brief Parsed form of the media query dialect understood by ViewportQueryEvaluator.
 *
 * Grammar (case-insensitive):
 *
 *     query       := alternative ( ',' alternative )*
 *     alternative := [ 'only' | 'not' ] type ( 'and' feature )*
 *                  | feature ( 'and' feature )*
 *     feature     := '(' name ':' value ')'
 *
 * with names min-width, max-width, width, min-height, max-height, height (integer values, optional
 * ``px``) and orientation (portrait | landscape). An alternative that does not follow the grammar never
 * matches, the other alternatives of the query are unaffected. An empty query never matches.
 */

#include <rangewatch/rangewatch_export.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rangewatch {

/**
 * @brief The state queries are evaluated against.
 */
struct RANGEWATCH_EXPORT Viewport {
    int width{0};
    int height{0};
    std::string media_type{"screen"};

    // Square viewports count as portrait.
    [[nodiscard]] bool is_portrait() const { return height >= width; }

    bool operator==(const Viewport&) const = default;
};

class RANGEWATCH_EXPORT ViewportQuery {
public:
    ViewportQuery() = default;

    /**
     * Parse ``text``. Never throws, check is_valid.
     */
    [[nodiscard]] static ViewportQuery parse(std::string_view text);

    /**
     * True when at least one alternative parsed.
     */
    [[nodiscard]] bool is_valid() const { return !alternatives_.empty(); }

    [[nodiscard]] bool matches(const Viewport& viewport) const;

    [[nodiscard]] const std::string& text() const { return text_; }

private:
    enum class FeatureKind : uint8_t { MIN_WIDTH, MAX_WIDTH, WIDTH, MIN_HEIGHT, MAX_HEIGHT, HEIGHT, ORIENTATION };

    struct Feature {
        FeatureKind kind;
        // Pixels, or 1 for portrait and 0 for landscape.
        int value;

        [[nodiscard]] bool matches(const Viewport& viewport) const;
    };

    struct Alternative {
        bool negated{false};
        std::string media_type;
        std::vector<Feature> features;

        [[nodiscard]] bool matches(const Viewport& viewport) const;
    };

    static std::optional<Alternative> parse_alternative(std::string_view text);
    static std::optional<Feature> parse_feature(std::string_view text);

    std::string text_;
    std::vector<Alternative> alternatives_;
};

}  // namespace rangewatch
