#include "query/logql.h"

#include <cctype>
#include <cstdint>

namespace logq {
namespace query {

// ============================================================================
// Tokenizer
// ============================================================================

namespace {

enum class TokenType {
    IDENTIFIER, STRING, DURATION,
    LBRACE, RBRACE, LPAREN, RPAREN, COMMA,
    EQ,         // =
    NEQ,        // !=
    RE,         // =~
    NRE,        // !~
    PIPE_EXACT, // |=
    PIPE_MATCH, // |~
    END_OF_FILE, INVALID
};

struct Token {
    TokenType type;
    std::string value;
    size_t pos;

    Token(TokenType t, std::string v, size_t p)
        : type(t), value(std::move(v)), pos(p) {}
};

void appendUtf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

class Tokenizer {
public:
    explicit Tokenizer(const std::string& input) : input_(input), pos_(0) {}

    std::vector<Token> tokenize() {
        std::vector<Token> tokens;
        while (true) {
            skipWhitespace();
            if (pos_ >= input_.size()) break;
            Token token = nextToken();
            bool invalid = token.type == TokenType::INVALID;
            tokens.push_back(std::move(token));
            if (invalid) return tokens;
        }
        tokens.emplace_back(TokenType::END_OF_FILE, "", pos_);
        return tokens;
    }

private:
    const std::string& input_;
    size_t pos_;

    char peek(size_t offset = 0) const {
        size_t p = pos_ + offset;
        return (p < input_.size()) ? input_[p] : '\0';
    }

    void skipWhitespace() {
        while (pos_ < input_.size() && std::isspace(static_cast<unsigned char>(peek()))) {
            ++pos_;
        }
    }

    Token nextToken() {
        size_t start = pos_;
        char ch = peek();

        if (ch == '"') return readQuoted(start);
        if (ch == '`') return readRaw(start);
        if (std::isalpha(static_cast<unsigned char>(ch)) || ch == '_') return readIdentifier(start);
        if (ch == '[') return readDuration(start);

        auto two = [&](TokenType t) {
            pos_ += 2;
            return Token(t, input_.substr(start, 2), start);
        };
        auto one = [&](TokenType t) {
            pos_ += 1;
            return Token(t, std::string(1, ch), start);
        };

        switch (ch) {
            case '{': return one(TokenType::LBRACE);
            case '}': return one(TokenType::RBRACE);
            case '(': return one(TokenType::LPAREN);
            case ')': return one(TokenType::RPAREN);
            case ',': return one(TokenType::COMMA);
            case '=':
                if (peek(1) == '~') return two(TokenType::RE);
                return one(TokenType::EQ);
            case '!':
                if (peek(1) == '=') return two(TokenType::NEQ);
                if (peek(1) == '~') return two(TokenType::NRE);
                break;
            case '|':
                if (peek(1) == '=') return two(TokenType::PIPE_EXACT);
                if (peek(1) == '~') return two(TokenType::PIPE_MATCH);
                break;
            default:
                break;
        }
        return Token(TokenType::INVALID, "unexpected character '" + std::string(1, ch) + "'", start);
    }

    Token readIdentifier(size_t start) {
        while (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '_') {
            ++pos_;
        }
        return Token(TokenType::IDENTIFIER, input_.substr(start, pos_ - start), start);
    }

    Token readDuration(size_t start) {
        ++pos_; // '['
        size_t close = input_.find(']', pos_);
        if (close == std::string::npos) {
            return Token(TokenType::INVALID, "unterminated range duration", start);
        }
        std::string text = input_.substr(pos_, close - pos_);
        pos_ = close + 1;
        return Token(TokenType::DURATION, text, start);
    }

    Token readRaw(size_t start) {
        ++pos_; // '`'
        size_t close = input_.find('`', pos_);
        if (close == std::string::npos) {
            return Token(TokenType::INVALID, "unterminated raw string", start);
        }
        std::string text = input_.substr(pos_, close - pos_);
        pos_ = close + 1;
        return Token(TokenType::STRING, text, start);
    }

    Token readQuoted(size_t start) {
        ++pos_; // '"'
        std::string value;
        while (true) {
            if (pos_ >= input_.size()) {
                return Token(TokenType::INVALID, "unterminated string", start);
            }
            char c = input_[pos_++];
            if (c == '"') break;
            if (c != '\\') {
                value += c;
                continue;
            }
            char esc = peek();
            ++pos_;
            switch (esc) {
                case 'n': value += '\n'; break;
                case 't': value += '\t'; break;
                case 'r': value += '\r'; break;
                case 'a': value += '\a'; break;
                case 'b': value += '\b'; break;
                case 'f': value += '\f'; break;
                case 'v': value += '\v'; break;
                case '"': value += '"'; break;
                case '\'': value += '\''; break;
                case '\\': value += '\\'; break;
                case 'x': {
                    int hi = hexValue(peek());
                    int lo = hexValue(peek(1));
                    if (hi < 0 || lo < 0) {
                        return Token(TokenType::INVALID, "invalid \\x escape in string", start);
                    }
                    value += static_cast<char>(hi * 16 + lo);
                    pos_ += 2;
                    break;
                }
                case 'u': {
                    uint32_t cp = 0;
                    for (int i = 0; i < 4; ++i) {
                        int h = hexValue(peek(i));
                        if (h < 0) {
                            return Token(TokenType::INVALID, "invalid \\u escape in string", start);
                        }
                        cp = cp * 16 + static_cast<uint32_t>(h);
                    }
                    pos_ += 4;
                    appendUtf8(value, cp);
                    break;
                }
                default:
                    return Token(TokenType::INVALID,
                        "invalid escape sequence '\\" + std::string(1, esc) + "' in string", start);
            }
        }
        return Token(TokenType::STRING, value, start);
    }
};

// ============================================================================
// Recursive-descent parser
// ============================================================================

class Parser {
public:
    explicit Parser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {}

    ParseResult parseQuery() {
        if (!tokens_.empty() && tokens_.back().type == TokenType::INVALID) {
            return fail(tokens_.back().value, tokens_.back().pos);
        }
        std::shared_ptr<Expr> expr;
        if (current().type == TokenType::IDENTIFIER) {
            expr = parseRangeAggregation();
        } else {
            expr = parseSelector();
        }
        if (!expr) return error_;
        if (current().type != TokenType::END_OF_FILE) {
            return fail("unexpected '" + current().value + "' after expression", current().pos);
        }
        return ParseResult::Success(std::move(expr));
    }

private:
    std::vector<Token> tokens_;
    size_t idx_ = 0;
    ParseResult error_;

    const Token& current() const { return tokens_[idx_]; }
    void advance() {
        if (idx_ + 1 < tokens_.size()) ++idx_;
    }

    ParseResult fail(std::string msg, size_t pos) {
        error_ = ParseResult::Failure(std::move(msg), pos);
        return error_;
    }

    bool expect(TokenType type, const char* what) {
        if (current().type != type) {
            fail(std::string("expected ") + what + " but found '" + current().value + "'", current().pos);
            return false;
        }
        advance();
        return true;
    }

    std::shared_ptr<Expr> parseRangeAggregation() {
        const Token name = current();
        auto agg = std::make_shared<RangeAggregationExpr>();
        if (name.value == "count_over_time") {
            agg->op = RangeOp::CountOverTime;
        } else if (name.value == "rate") {
            agg->op = RangeOp::Rate;
        } else {
            fail("unknown function '" + name.value + "'", name.pos);
            return nullptr;
        }
        advance();
        if (!expect(TokenType::LPAREN, "'('")) return nullptr;

        auto selector = parseSelector();
        if (!selector) return nullptr;
        agg->selector = std::move(selector);

        if (current().type != TokenType::DURATION) {
            fail("expected range duration like [5m] after log selector", current().pos);
            return nullptr;
        }
        auto range = parseDuration(current().value);
        if (!range || range->count() <= 0) {
            fail("invalid range duration '" + current().value + "'", current().pos);
            return nullptr;
        }
        agg->range = *range;
        advance();
        if (!expect(TokenType::RPAREN, "')'")) return nullptr;
        return agg;
    }

    std::shared_ptr<LogSelectorExpr> parseSelector() {
        if (!expect(TokenType::LBRACE, "'{'")) return nullptr;
        auto selector = std::make_shared<LogSelectorExpr>();

        while (current().type != TokenType::RBRACE) {
            if (current().type != TokenType::IDENTIFIER) {
                fail("expected label name but found '" + current().value + "'", current().pos);
                return nullptr;
            }
            LabelMatcher m;
            m.name = current().value;
            advance();

            switch (current().type) {
                case TokenType::EQ: m.type = MatchType::Equal; break;
                case TokenType::NEQ: m.type = MatchType::NotEqual; break;
                case TokenType::RE: m.type = MatchType::Regexp; break;
                case TokenType::NRE: m.type = MatchType::NotRegexp; break;
                default:
                    fail("expected matcher operator after '" + m.name + "'", current().pos);
                    return nullptr;
            }
            advance();

            if (current().type != TokenType::STRING) {
                fail("expected quoted label value for '" + m.name + "'", current().pos);
                return nullptr;
            }
            m.value = current().value;
            size_t value_pos = current().pos;
            advance();

            if (m.type == MatchType::Regexp || m.type == MatchType::NotRegexp) {
                try {
                    m.re = std::make_shared<const std::regex>("^(?:" + m.value + ")$");
                } catch (const std::regex_error& e) {
                    fail("invalid regex '" + m.value + "': " + e.what(), value_pos);
                    return nullptr;
                }
            }
            selector->matchers.push_back(std::move(m));

            if (current().type == TokenType::COMMA) {
                advance();
            } else if (current().type != TokenType::RBRACE) {
                fail("expected ',' or '}' but found '" + current().value + "'", current().pos);
                return nullptr;
            }
        }
        advance(); // '}'

        if (selector->matchers.empty()) {
            fail("log selector needs at least one label matcher", tokens_[idx_ > 0 ? idx_ - 1 : 0].pos);
            return nullptr;
        }

        while (true) {
            LineFilter f;
            switch (current().type) {
                case TokenType::PIPE_EXACT: f.type = FilterType::Contains; break;
                case TokenType::NEQ: f.type = FilterType::NotContains; break;
                case TokenType::PIPE_MATCH: f.type = FilterType::Regexp; break;
                case TokenType::NRE: f.type = FilterType::NotRegexp; break;
                default:
                    return selector;
            }
            advance();
            if (current().type != TokenType::STRING) {
                fail("expected quoted string after line filter", current().pos);
                return nullptr;
            }
            f.match = current().value;
            size_t match_pos = current().pos;
            advance();
            if (f.type == FilterType::Regexp || f.type == FilterType::NotRegexp) {
                try {
                    f.re = std::make_shared<const std::regex>(f.match);
                } catch (const std::regex_error& e) {
                    fail("invalid regex '" + f.match + "': " + e.what(), match_pos);
                    return nullptr;
                }
            }
            selector->filters.push_back(std::move(f));
        }
    }
};

const char* matchOp(MatchType t) {
    switch (t) {
        case MatchType::Equal: return "=";
        case MatchType::NotEqual: return "!=";
        case MatchType::Regexp: return "=~";
        case MatchType::NotRegexp: return "!~";
    }
    return "=";
}

const char* filterOp(FilterType t) {
    switch (t) {
        case FilterType::Contains: return "|=";
        case FilterType::NotContains: return "!=";
        case FilterType::Regexp: return "|~";
        case FilterType::NotRegexp: return "!~";
    }
    return "|=";
}

} // namespace

// ============================================================================
// AST behaviour
// ============================================================================

bool LabelMatcher::matches(const std::string& label_value) const {
    switch (type) {
        case MatchType::Equal: return label_value == value;
        case MatchType::NotEqual: return label_value != value;
        case MatchType::Regexp: return re && std::regex_match(label_value, *re);
        case MatchType::NotRegexp: return re && !std::regex_match(label_value, *re);
    }
    return false;
}

std::string LabelMatcher::toString() const {
    return name + matchOp(type) + quoteString(value);
}

bool LineFilter::matches(const std::string& line) const {
    switch (type) {
        case FilterType::Contains: return line.find(match) != std::string::npos;
        case FilterType::NotContains: return line.find(match) == std::string::npos;
        case FilterType::Regexp: return re && std::regex_search(line, *re);
        case FilterType::NotRegexp: return re && !std::regex_search(line, *re);
    }
    return false;
}

std::string LineFilter::toString() const {
    return std::string(filterOp(type)) + " " + quoteString(match);
}

std::string LogSelectorExpr::toString() const {
    std::string out = "{";
    for (size_t i = 0; i < matchers.size(); ++i) {
        if (i > 0) out += ", ";
        out += matchers[i].toString();
    }
    out += "}";
    for (const auto& f : filters) {
        out += " ";
        out += f.toString();
    }
    return out;
}

bool LogSelectorExpr::matchesLabels(const LabelSet& labels) const {
    static const std::string empty;
    for (const auto& m : matchers) {
        auto it = labels.find(m.name);
        if (!m.matches(it == labels.end() ? empty : it->second)) return false;
    }
    return true;
}

bool LogSelectorExpr::matchesLine(const std::string& line) const {
    for (const auto& f : filters) {
        if (!f.matches(line)) return false;
    }
    return true;
}

std::string RangeAggregationExpr::toString() const {
    std::string name = op == RangeOp::Rate ? "rate" : "count_over_time";
    return name + "(" + (selector ? selector->toString() : std::string("{}")) +
           "[" + formatDuration(range) + "])";
}

// ============================================================================
// Entry points
// ============================================================================

ParseResult LogQLParser::parse(const std::string& query) {
    Tokenizer tokenizer(query);
    Parser parser(tokenizer.tokenize());
    return parser.parseQuery();
}

ParseResult LogQLParser::parseLogSelector(const std::string& query) {
    auto result = parse(query);
    if (result.success && result.expr->getType() != ExprType::LogSelector) {
        return ParseResult::Failure("expected a log selector, got a metric expression", 0);
    }
    return result;
}

std::shared_ptr<LogSelectorExpr> withLineFilter(
    const LogSelectorExpr& selector, FilterType type, std::string match)
{
    auto out = std::make_shared<LogSelectorExpr>(selector);
    LineFilter f;
    f.type = type;
    f.match = std::move(match);
    if (type == FilterType::Regexp || type == FilterType::NotRegexp) {
        f.re = std::make_shared<const std::regex>(f.match); // throws std::regex_error
    }
    out->filters.push_back(std::move(f));
    return out;
}

std::optional<std::chrono::nanoseconds> parseDuration(std::string_view text) {
    using namespace std::chrono;
    if (text.empty()) return std::nullopt;

    nanoseconds total{0};
    size_t pos = 0;
    while (pos < text.size()) {
        if (!std::isdigit(static_cast<unsigned char>(text[pos]))) return std::nullopt;
        int64_t n = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            n = n * 10 + (text[pos] - '0');
            if (n > 1000000000LL) return std::nullopt;
            ++pos;
        }
        if (pos >= text.size()) return std::nullopt;

        int64_t unit = 0;
        if (text.compare(pos, 2, "ms") == 0) {
            unit = duration_cast<nanoseconds>(milliseconds(1)).count();
            pos += 2;
        } else {
            switch (text[pos]) {
                case 's': unit = duration_cast<nanoseconds>(seconds(1)).count(); break;
                case 'm': unit = duration_cast<nanoseconds>(minutes(1)).count(); break;
                case 'h': unit = duration_cast<nanoseconds>(hours(1)).count(); break;
                case 'd': unit = duration_cast<nanoseconds>(hours(24)).count(); break;
                default: return std::nullopt;
            }
            ++pos;
        }

        // Each term and the running sum must fit in int64 nanoseconds
        const int64_t max = nanoseconds::max().count();
        if (n > max / unit) return std::nullopt;
        int64_t term = n * unit;
        if (total.count() > max - term) return std::nullopt;
        total += nanoseconds(term);
    }
    return total;
}

std::string formatDuration(std::chrono::nanoseconds d) {
    int64_t ms = std::chrono::duration_cast<std::chrono::milliseconds>(d).count();
    if (ms == 0) return "0s";

    std::string out;
    const struct { int64_t size; const char* unit; } units[] = {
        {86400000, "d"}, {3600000, "h"}, {60000, "m"}, {1000, "s"}, {1, "ms"}
    };
    for (const auto& u : units) {
        if (ms >= u.size) {
            out += std::to_string(ms / u.size) + u.unit;
            ms %= u.size;
        }
    }
    return out;
}

} // namespace query
} // namespace logq
