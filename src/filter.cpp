/**
 * @file filter.cpp
 * @brief Recursive-descent filter parser and structural evaluator
 */

#include "dirmock/filter.h"
#include "dirmock/password_verifier.h"
#include "dirmock/string_utils.h"
#include <algorithm>
#include <cctype>

namespace dirmock {

namespace {

class FilterParser {
public:
    explicit FilterParser(std::string text) : text_(std::move(text)) {}

    Outcome<FilterNode> parse() {
        FilterNode root;
        skipSpaces();
        bool ok = parseFilter(root);
        skipSpaces();
        if (ok && !atEnd()) {
            fail("unexpected trailing text at offset " + std::to_string(pos_));
            ok = false;
        }

        if (!ok) {
            return DirectoryError::filterError("Bad search filter '" + text_ + "': " + syntaxError_);
        }
        if (!unsupported_.empty()) {
            return DirectoryError::unsupportedFilter(
                "Unsupported filter operation in '" + text_ + "': " + unsupported_);
        }
        return root;
    }

private:
    bool atEnd() const { return pos_ >= text_.length(); }

    char peek() const { return atEnd() ? '\0' : text_[pos_]; }

    void skipSpaces() {
        while (!atEnd() && std::isspace(static_cast<unsigned char>(text_[pos_]))) {
            ++pos_;
        }
    }

    bool fail(const std::string& message) {
        if (syntaxError_.empty()) {
            syntaxError_ = message;
        }
        return false;
    }

    // Record the first unsupported construct; parsing continues so that
    // syntax errors elsewhere still win
    void markUnsupported(const std::string& what) {
        if (unsupported_.empty()) {
            unsupported_ = what;
        }
    }

    bool expect(char c) {
        if (peek() != c) {
            return fail(std::string("expected '") + c + "' at offset " + std::to_string(pos_));
        }
        ++pos_;
        return true;
    }

    bool parseFilter(FilterNode& node) {
        if (!expect('(')) {
            return false;
        }
        skipSpaces();

        bool ok = false;
        switch (peek()) {
            case '&':
                ++pos_;
                node.type = FilterNode::Type::And;
                ok = parseList(node.children);
                break;
            case '|':
                ++pos_;
                node.type = FilterNode::Type::Or;
                ok = parseList(node.children);
                break;
            case '!': {
                ++pos_;
                skipSpaces();
                node.type = FilterNode::Type::Not;
                FilterNode child;
                ok = parseFilter(child);
                if (ok) {
                    node.children.push_back(std::move(child));
                }
                break;
            }
            default:
                ok = parseItem(node);
                break;
        }

        if (!ok) {
            return false;
        }
        skipSpaces();
        return expect(')');
    }

    bool parseList(std::vector<FilterNode>& children) {
        while (true) {
            skipSpaces();
            if (peek() == ')') {
                return true;
            }
            if (atEnd()) {
                return fail("unterminated filter list");
            }
            FilterNode child;
            if (!parseFilter(child)) {
                return false;
            }
            children.push_back(std::move(child));
        }
    }

    bool parseItem(FilterNode& node) {
        size_t start = pos_;
        while (!atEnd()) {
            char c = text_[pos_];
            if (c == '=' || c == '~' || c == '<' || c == '>' || c == ':' ||
                c == '(' || c == ')') {
                break;
            }
            ++pos_;
        }
        std::string attribute = utils::trim(text_.substr(start, pos_ - start));

        if (atEnd()) {
            return fail("missing filter type after '" + attribute + "'");
        }

        char c = text_[pos_];
        if (c == ':') {
            // Extensible match: attr[:dn][:rule]:=value
            size_t assign = text_.find(":=", pos_);
            if (assign == std::string::npos) {
                return fail("malformed extensible match");
            }
            pos_ = assign + 2;
            std::string ignored;
            if (!readValue(ignored)) {
                return false;
            }
            markUnsupported("extensible match");
            node = FilterNode::presence(attribute);
            return true;
        }

        if (attribute.empty()) {
            return fail("empty attribute description at offset " + std::to_string(start));
        }
        if (!isValidAttributeDescription(attribute)) {
            return fail("invalid attribute description '" + attribute + "'");
        }

        if (c == '~' || c == '<' || c == '>') {
            ++pos_;
            if (!expect('=')) {
                return false;
            }
            std::string ignored;
            if (!readValue(ignored)) {
                return false;
            }
            markUnsupported(c == '~' ? "approximate match" : "ordering match");
            node = FilterNode::presence(attribute);
            return true;
        }

        if (c != '=') {
            return fail("unexpected '" + std::string(1, c) + "' after attribute '" + attribute + "'");
        }
        ++pos_;

        std::string raw;
        if (!readValue(raw)) {
            return false;
        }

        if (raw == "*") {
            node = FilterNode::presence(attribute);
            return true;
        }

        if (raw.find('*') != std::string::npos) {
            markUnsupported("substring match on '" + attribute + "'");
            node = FilterNode::presence(attribute);
            return true;
        }

        std::string value;
        if (!unescape(raw, value)) {
            return false;
        }
        node = FilterNode::equality(attribute, value);
        return true;
    }

    // Raw assertion value up to the closing ')'
    bool readValue(std::string& raw) {
        size_t start = pos_;
        while (!atEnd()) {
            char c = text_[pos_];
            if (c == ')') {
                raw = text_.substr(start, pos_ - start);
                return true;
            }
            if (c == '(') {
                return fail("unescaped '(' in assertion value");
            }
            ++pos_;
        }
        return fail("unterminated assertion value");
    }

    bool unescape(const std::string& raw, std::string& value) {
        value.reserve(raw.length());
        for (size_t i = 0; i < raw.length(); ++i) {
            if (raw[i] != '\\') {
                value += raw[i];
                continue;
            }
            if (i + 2 >= raw.length()) {
                return fail("truncated escape in assertion value");
            }
            int hi = utils::hexDigitValue(raw[i + 1]);
            int lo = utils::hexDigitValue(raw[i + 2]);
            if (hi < 0 || lo < 0) {
                return fail("invalid escape in assertion value");
            }
            value += static_cast<char>((hi << 4) | lo);
            i += 2;
        }
        return true;
    }

    static bool isValidAttributeDescription(const std::string& attribute) {
        return std::all_of(attribute.begin(), attribute.end(), [](unsigned char c) {
            return std::isalnum(c) || c == '-' || c == ';' || c == '.' || c == '_';
        });
    }

    std::string text_;
    size_t pos_ = 0;
    std::string syntaxError_;
    std::string unsupported_;
};

} // anonymous namespace

FilterNode FilterNode::equality(std::string attribute, std::string value) {
    FilterNode node;
    node.type = Type::Equality;
    node.attribute = std::move(attribute);
    node.value = std::move(value);
    return node;
}

FilterNode FilterNode::presence(std::string attribute) {
    FilterNode node;
    node.type = Type::Presence;
    node.attribute = std::move(attribute);
    return node;
}

FilterNode FilterNode::conjunction(std::vector<FilterNode> children) {
    FilterNode node;
    node.type = Type::And;
    node.children = std::move(children);
    return node;
}

FilterNode FilterNode::disjunction(std::vector<FilterNode> children) {
    FilterNode node;
    node.type = Type::Or;
    node.children = std::move(children);
    return node;
}

FilterNode FilterNode::negation(FilterNode child) {
    FilterNode node;
    node.type = Type::Not;
    node.children.push_back(std::move(child));
    return node;
}

std::string FilterNode::toString() const {
    switch (type) {
        case Type::Equality:
            return "(" + attribute + "=" + escapeFilterValue(value) + ")";
        case Type::Presence:
            return "(" + attribute + "=*)";
        case Type::And:
        case Type::Or: {
            std::string text = type == Type::And ? "(&" : "(|";
            for (const auto& child : children) {
                text += child.toString();
            }
            return text + ")";
        }
        case Type::Not:
            return "(!" + (children.empty() ? std::string() : children.front().toString()) + ")";
    }
    return "";
}

Outcome<FilterNode> parseFilter(const std::string& text) {
    std::string trimmed = utils::trim(text);
    if (trimmed.empty()) {
        return DirectoryError::filterError("Bad search filter: empty filter");
    }
    if (trimmed.front() != '(') {
        trimmed = "(" + trimmed + ")";
    }
    return FilterParser(trimmed).parse();
}

FilterEvaluator::FilterEvaluator(std::string credentialAttribute)
    : credentialAttribute_(std::move(credentialAttribute)) {}

bool FilterEvaluator::matches(const FilterNode& node, const Entry& entry) const {
    switch (node.type) {
        case FilterNode::Type::Equality:
            return matchesEquality(node, entry);
        case FilterNode::Type::Presence:
            return entry.has(node.attribute);
        case FilterNode::Type::And:
            return std::all_of(node.children.begin(), node.children.end(),
                               [&](const FilterNode& child) { return matches(child, entry); });
        case FilterNode::Type::Or:
            return std::any_of(node.children.begin(), node.children.end(),
                               [&](const FilterNode& child) { return matches(child, entry); });
        case FilterNode::Type::Not:
            return !node.children.empty() && !matches(node.children.front(), entry);
    }
    return false;
}

bool FilterEvaluator::matchesEquality(const FilterNode& node, const Entry& entry) const {
    const ValueList* values = entry.values(node.attribute);
    if (!values) {
        return false;
    }

    if (utils::equalsIgnoreCase(node.attribute, credentialAttribute_)) {
        return std::any_of(values->begin(), values->end(), [&node](const Value& stored) {
            return verifyPassword(node.value, stored);
        });
    }

    return std::find(values->begin(), values->end(), node.value) != values->end();
}

std::string escapeFilterValue(const std::string& value) {
    std::string escaped;
    escaped.reserve(value.length() * 2);

    for (char c : value) {
        switch (c) {
            case '*':
                escaped += "\\2a";
                break;
            case '(':
                escaped += "\\28";
                break;
            case ')':
                escaped += "\\29";
                break;
            case '\\':
                escaped += "\\5c";
                break;
            case '\0':
                escaped += "\\00";
                break;
            default:
                escaped += c;
        }
    }

    return escaped;
}

} // namespace dirmock
