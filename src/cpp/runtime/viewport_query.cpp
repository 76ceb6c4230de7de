#include <rangewatch/runtime/viewport_query.h>

#include <algorithm>
#include <cctype>
#include <charconv>

namespace rangewatch {

namespace {

std::string_view trim(std::string_view text) {
    auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    while (!text.empty() && is_space(text.front())) { text.remove_prefix(1); }
    while (!text.empty() && is_space(text.back())) { text.remove_suffix(1); }
    return text;
}

std::string lower(std::string_view text) {
    std::string result{text};
    std::transform(result.begin(), result.end(), result.begin(),
                   [](char c) { return static_cast<char>(std::tolower(static_cast<unsigned char>(c))); });
    return result;
}

struct Token {
    enum class Kind { WORD, GROUP };
    Kind kind;
    std::string_view text;
};

// Splits an alternative into words and parenthesised groups, nullopt on any other character.
std::optional<std::vector<Token>> tokenize(std::string_view text) {
    std::vector<Token> tokens;
    std::size_t pos{0};
    while (pos < text.size()) {
        auto c = static_cast<unsigned char>(text[pos]);
        if (std::isspace(c)) {
            ++pos;
        } else if (c == '(') {
            auto close = text.find(')', pos + 1);
            if (close == std::string_view::npos) { return std::nullopt; }
            tokens.push_back({Token::Kind::GROUP, text.substr(pos + 1, close - pos - 1)});
            pos = close + 1;
        } else if (std::isalnum(c) || c == '-' || c == '_') {
            auto start = pos;
            while (pos < text.size()) {
                auto w = static_cast<unsigned char>(text[pos]);
                if (!(std::isalnum(w) || w == '-' || w == '_')) { break; }
                ++pos;
            }
            tokens.push_back({Token::Kind::WORD, text.substr(start, pos - start)});
        } else {
            return std::nullopt;
        }
    }
    return tokens;
}

std::optional<int> parse_pixels(std::string_view value) {
    if (value.ends_with("px")) { value.remove_suffix(2); }
    value = trim(value);
    int result{0};
    auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), result);
    if (ec != std::errc{} || ptr != value.data() + value.size() || result < 0) { return std::nullopt; }
    return result;
}

}  // namespace

ViewportQuery ViewportQuery::parse(std::string_view text) {
    ViewportQuery query;
    query.text_ = std::string{text};
    auto normalised = lower(text);
    std::string_view remaining{normalised};
    while (true) {
        auto comma = remaining.find(',');
        auto alternative = parse_alternative(trim(remaining.substr(0, comma)));
        if (alternative) { query.alternatives_.push_back(std::move(*alternative)); }
        if (comma == std::string_view::npos) { break; }
        remaining.remove_prefix(comma + 1);
    }
    return query;
}

bool ViewportQuery::matches(const Viewport& viewport) const {
    return std::any_of(alternatives_.begin(), alternatives_.end(),
                       [&viewport](const Alternative& alternative) { return alternative.matches(viewport); });
}

bool ViewportQuery::Feature::matches(const Viewport& viewport) const {
    switch (kind) {
        case FeatureKind::MIN_WIDTH: return viewport.width >= value;
        case FeatureKind::MAX_WIDTH: return viewport.width <= value;
        case FeatureKind::WIDTH: return viewport.width == value;
        case FeatureKind::MIN_HEIGHT: return viewport.height >= value;
        case FeatureKind::MAX_HEIGHT: return viewport.height <= value;
        case FeatureKind::HEIGHT: return viewport.height == value;
        case FeatureKind::ORIENTATION: return viewport.is_portrait() == (value == 1);
    }
    return false;
}

bool ViewportQuery::Alternative::matches(const Viewport& viewport) const {
    bool type_matches = media_type.empty() || media_type == "all" || media_type == lower(viewport.media_type);
    bool result = type_matches && std::all_of(features.begin(), features.end(),
                                              [&viewport](const Feature& f) { return f.matches(viewport); });
    return negated ? !result : result;
}

std::optional<ViewportQuery::Alternative> ViewportQuery::parse_alternative(std::string_view text) {
    auto tokens = tokenize(text);
    if (!tokens || tokens->empty()) { return std::nullopt; }

    Alternative alternative;
    std::size_t i{0};
    const auto n = tokens->size();
    const auto& t = *tokens;

    auto is_word = [&t, n](std::size_t index, std::string_view word = {}) {
        return index < n && t[index].kind == Token::Kind::WORD && (word.empty() || t[index].text == word);
    };

    if (is_word(i, "only") || is_word(i, "not")) {
        alternative.negated = t[i].text == "not";
        ++i;
        // A media type must follow the prefix.
        if (!is_word(i) || is_word(i, "and")) { return std::nullopt; }
    }

    if (is_word(i)) {
        if (is_word(i, "and")) { return std::nullopt; }
        alternative.media_type = std::string{t[i].text};
        ++i;
    } else {
        auto feature = parse_feature(t[i].text);
        if (!feature) { return std::nullopt; }
        alternative.features.push_back(*feature);
        ++i;
    }

    while (i < n) {
        if (!is_word(i, "and") || i + 1 >= n || t[i + 1].kind != Token::Kind::GROUP) { return std::nullopt; }
        auto feature = parse_feature(t[i + 1].text);
        if (!feature) { return std::nullopt; }
        alternative.features.push_back(*feature);
        i += 2;
    }
    return alternative;
}

std::optional<ViewportQuery::Feature> ViewportQuery::parse_feature(std::string_view text) {
    auto colon = text.find(':');
    if (colon == std::string_view::npos) { return std::nullopt; }
    auto name = trim(text.substr(0, colon));
    auto value = trim(text.substr(colon + 1));

    if (name == "orientation") {
        if (value == "portrait") { return Feature{FeatureKind::ORIENTATION, 1}; }
        if (value == "landscape") { return Feature{FeatureKind::ORIENTATION, 0}; }
        return std::nullopt;
    }

    FeatureKind kind;
    if (name == "min-width") {
        kind = FeatureKind::MIN_WIDTH;
    } else if (name == "max-width") {
        kind = FeatureKind::MAX_WIDTH;
    } else if (name == "width") {
        kind = FeatureKind::WIDTH;
    } else if (name == "min-height") {
        kind = FeatureKind::MIN_HEIGHT;
    } else if (name == "max-height") {
        kind = FeatureKind::MAX_HEIGHT;
    } else if (name == "height") {
        kind = FeatureKind::HEIGHT;
    } else {
        return std::nullopt;
    }
    auto pixels = parse_pixels(value);
    if (!pixels) { return std::nullopt; }
    return Feature{kind, *pixels};
}

}  // namespace rangewatch
