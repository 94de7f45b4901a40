#include <algorithm>
#include <cctype>
#include <cerrno>
#include <fstream>
#include <jailer/config_file.hh>
#include <jailer/errmsg.hh>
#include <jailer/macros/throw.hh>
#include <sstream>

using std::string;
using std::string_view;

namespace {

constexpr bool is_ws(char c) noexcept { return c == ' ' or c == '\t' or c == '\r'; }

constexpr bool is_name_char(char c) noexcept {
    return (c >= 'a' and c <= 'z') or (c >= 'A' and c <= 'Z') or (c >= '0' and c <= '9') or
        c == '-' or c == '_' or c == '.';
}

constexpr int hex_value(char c) noexcept {
    if (c >= '0' and c <= '9') {
        return c - '0';
    }
    if (c >= 'a' and c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' and c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

// Cursor over the config text, the text always ends with '\n'
class Parser {
    const string& text_;
    size_t pos_ = 0;

public:
    explicit Parser(const string& text) noexcept : text_(text) {}

    [[nodiscard]] bool at_end() const noexcept { return pos_ >= text_.size(); }

    [[nodiscard]] char peek(size_t offset = 0) const noexcept {
        return pos_ + offset < text_.size() ? text_[pos_ + offset] : '\n';
    }

    void advance(size_t n = 1) noexcept { pos_ = std::min(pos_ + n, text_.size()); }

    void skip_ws() noexcept {
        while (!at_end() and is_ws(peek())) {
            advance();
        }
    }

    void skip_ws_and_newlines() noexcept {
        while (!at_end() and (is_ws(peek()) or peek() == '\n')) {
            advance();
        }
    }

    void skip_comment() noexcept {
        while (!at_end() and peek() != '\n') {
            advance();
        }
    }

    string_view extract_name() noexcept {
        size_t beg = pos_;
        while (!at_end() and is_name_char(peek())) {
            advance();
        }
        return string_view{text_}.substr(beg, pos_ - beg);
    }

    template <class... Args>
    [[noreturn]] void fail(Args&&... msg) const {
        size_t pos = std::min(pos_, text_.size() - 1);
        size_t line_beg = pos == 0 ? 0 : text_.rfind('\n', pos - 1) + 1;
        size_t line_end = text_.find('\n', pos);
        auto line = 1 + std::count(text_.begin(), text_.begin() + line_beg, '\n');
        throw ConfigFile::ParseError(
            line,
            pos - line_beg + 1,
            concat_tostr(std::forward<Args>(msg)...),
            concat_tostr(
                string_view{text_}.substr(line_beg, line_end - line_beg),
                '\n',
                string(pos - line_beg, ' '),
                '^'
            )
        );
    }

    string extract_value(bool in_array) {
        string res;
        if (peek() == '\'') {
            advance();
            for (;;) {
                if (peek() == '\n') {
                    fail("Missing terminating ' character");
                }
                if (peek() == '\'') {
                    if (peek(1) != '\'') {
                        advance();
                        return res;
                    }
                    advance();
                }
                res += peek();
                advance();
            }
        }

        if (peek() == '"') {
            advance();
            for (;;) {
                char c = peek();
                if (c == '\n') {
                    fail("Missing terminating \" character");
                }
                advance();
                if (c == '"') {
                    return res;
                }
                if (c != '\\') {
                    res += c;
                    continue;
                }
                c = peek();
                switch (c) {
                case '\'':
                case '"':
                case '\\': res += c; break;
                case '0': res += '\0'; break;
                case 't': res += '\t'; break;
                case 'n': res += '\n'; break;
                case 'r': res += '\r'; break;
                case 'x': {
                    int hi = hex_value(peek(1));
                    int lo = hex_value(peek(2));
                    if (hi < 0 or lo < 0) {
                        advance(hi < 0 ? 1 : 2);
                        fail("Invalid hexadecimal digit: `", peek(), '`');
                    }
                    res += static_cast<char>(hi * 16 + lo);
                    advance(2);
                    break;
                }
                default: fail("Unknown escape sequence: `\\", c, '`');
                }
                advance();
            }
        }

        // Unquoted literal
        if (peek() == '[' or (in_array and (peek() == ',' or peek() == ']'))) {
            fail("Invalid beginning of the string literal: `", peek(), '`');
        }
        auto is_terminator = [in_array](char c) {
            return c == '\n' or c == '#' or (in_array and (c == ',' or c == ']'));
        };
        while (!is_terminator(peek())) {
            res += peek();
            advance();
        }
        while (!res.empty() and is_ws(res.back())) {
            res.pop_back();
        }
        return res;
    }
};

} // namespace

bool ConfigFile::Variable::as_bool() const noexcept {
    auto lower_equal = [&](string_view other) {
        return std::equal(
            str_.begin(), str_.end(), other.begin(), other.end(), [](char a, char b) {
                return std::tolower(static_cast<unsigned char>(a)) == b;
            }
        );
    };
    return str_ == "1" or lower_equal("on") or lower_equal("true");
}

void ConfigFile::load_config_from_file(const char* path, bool load_all) {
    std::ifstream file(path);
    if (!file.is_open()) {
        THROW("cannot open config file '", path, '\'', errmsg());
    }
    std::stringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        THROW("failed to read config file '", path, '\'');
    }
    load_config_from_string(std::move(ss).str(), load_all);
}

void ConfigFile::load_config_from_string(string config, bool load_all) {
    for (auto& [name, var] : vars_) {
        var.unset();
    }

    config += '\n';
    Parser p{config};
    Variable ignored;

    while (!p.at_end()) {
        p.skip_ws();
        if (p.peek() == '\n') {
            p.advance();
            continue;
        }
        if (p.peek() == '#') {
            p.skip_comment();
            continue;
        }

        string_view name = p.extract_name();
        if (name.empty()) {
            p.fail("Invalid or missing variable's name");
        }
        p.skip_ws();
        if (p.peek() == '\n' or p.peek() == '#') {
            p.fail("Incomplete directive: `", name, '`');
        }
        if (p.peek() != '=' and p.peek() != ':') {
            p.fail("Invalid assignment operator: `", p.peek(), '`');
        }
        p.advance();
        p.skip_ws();

        Variable* var = &ignored;
        if (load_all) {
            var = &vars_[string{name}];
        } else if (auto it = vars_.find(name); it != vars_.end()) {
            var = &it->second;
        }
        var->unset();
        var->flag_ = Variable::SET;

        if (p.peek() != '[') {
            if (p.peek() != '\n' and p.peek() != '#') {
                var->str_ = p.extract_value(false);
            }
        } else {
            var->flag_ |= Variable::ARRAY;
            p.advance();
            for (;;) {
                p.skip_ws_and_newlines();
                if (p.at_end()) {
                    p.fail("Missing terminating ] character at the end of an array");
                }
                if (p.peek() == ']') {
                    p.advance();
                    break;
                }
                if (p.peek() == '#') {
                    p.skip_comment();
                    continue;
                }
                if (p.peek() == ',') {
                    p.advance();
                    continue;
                }

                var->arr_.emplace_back(p.extract_value(true));
                p.skip_ws();
                if (p.peek() == ',' or p.peek() == '\n') {
                    p.advance();
                } else if (p.peek() == '#') {
                    p.skip_comment();
                } else if (p.peek() == ']') {
                    p.advance();
                    break;
                } else {
                    p.fail("Unknown sequence after the value: `", p.peek(), '`');
                }
            }
        }

        p.skip_ws();
        if (p.peek() == '#') {
            p.skip_comment();
            continue;
        }
        if (p.peek() != '\n') {
            p.fail("Unknown sequence after the value: `", p.peek(), '`');
        }
        p.advance();
    }
}

string ConfigFile::escape_string(string_view str) {
    bool needs_double_quotes = std::any_of(str.begin(), str.end(), [](char c) {
        return c == '\'' or std::iscntrl(static_cast<unsigned char>(c));
    });
    if (needs_double_quotes) {
        string res{'"'};
        for (char c : str) {
            switch (c) {
            case '"': res += "\\\""; break;
            case '\\': res += "\\\\"; break;
            case '\n': res += "\\n"; break;
            case '\t': res += "\\t"; break;
            case '\r': res += "\\r"; break;
            default:
                if (std::iscntrl(static_cast<unsigned char>(c))) {
                    constexpr char digits[] = "0123456789abcdef";
                    auto uc = static_cast<unsigned char>(c);
                    back_insert(res, "\\x", digits[uc >> 4], digits[uc & 15]);
                } else {
                    res += c;
                }
            }
        }
        return res += '"';
    }

    bool is_literal = !str.empty() and !is_ws(str.front()) and !is_ws(str.back()) and
        str.front() != '[' and str.front() != '"' and
        str.find_first_of("\n],#") == string_view::npos;
    if (is_literal) {
        return string{str};
    }
    return concat_tostr('\'', str, '\'');
}
