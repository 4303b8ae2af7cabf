#pragma once

#include "data/respondent_table.hpp"
#include "diagnostics.hpp"
#include "text_utils.hpp"

#include <array>
#include <cctype>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// Base filter expressions
//
// A closed boolean grammar over respondent columns:
//
//   expr    := and_expr (('|' | '||') and_expr)*
//   and_expr:= unary (('&' | '&&') unary)*
//   unary   := '!' unary | '(' expr ')' | 'is.na' '(' ident ')' | comparison
//              | 'TRUE' | 'FALSE'
//   comparison := operand (cmp operand | '%in%' 'c' '(' operand (',' operand)* ')')
//   operand := ident | number | 'string' | "string"
//
// Evaluation is three-valued: a comparison touching a missing value is NA,
// and NA rows are dropped from the base.
// ---------------------------------------------------------------------------
namespace filter {

enum class TokenKind {
    IDENT, NUMBER, STRING,
    LPAREN, RPAREN, COMMA,
    AND, OR, NOT,
    EQ, NE, LT, LE, GT, GE, IN,
    END,
};

struct Token {
    TokenKind kind = TokenKind::END;
    std::string text;
    double number = 0.0;
};

constexpr std::array<const char*, 20> DANGEROUS_PATTERNS = {
    "system(", "eval(", "source(", "library(", "require(", "<-", "<<-", "->", "->>",
    "rm(", "file.", "sink(", "options(", ".GlobalEnv", "::", ":::", "get(", "assign(",
    "mget(", "do.call(",
};

namespace detail {

inline CrosstabError eval_failed(const std::string& expr, const std::string& problem) {
    return CrosstabError(ErrorCode::DATA_FILTER_EVAL_FAILED, "Filter Evaluation Failed",
                         "Filter '" + expr + "': " + problem,
                         "The question's base cannot be determined.",
                         "Check the BaseFilter syntax and column names.");
}

inline bool allowed_char(char c) {
    if (std::isalnum(static_cast<unsigned char>(c))) return true;
    static const std::string extra = "_$.()&|!<>= +*/,'\"[]%:-";
    return extra.find(c) != std::string::npos;
}

inline bool ident_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_' || c == '.';
}

inline bool ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.';
}

}  // namespace detail

// Reject characters outside the allow-list and code-execution patterns.
inline void check_safety(const std::string& expr) {
    for (char c : expr) {
        if (!detail::allowed_char(c)) {
            throw CrosstabError(ErrorCode::ARG_UNSAFE_FILTER, "Unsafe Filter Expression",
                                "Filter '" + expr + "' contains the character '" +
                                    std::string(1, c) + "'",
                                "Filters are restricted to comparisons on columns.",
                                "Use column names, literals, comparisons and & | !.");
        }
    }
    for (const char* pattern : DANGEROUS_PATTERNS) {
        if (expr.find(pattern) != std::string::npos) {
            throw CrosstabError(ErrorCode::ARG_DANGEROUS_FILTER, "Dangerous Filter Expression",
                                "Filter '" + expr + "' contains '" + pattern + "'",
                                "Filters may not execute code or touch the environment.",
                                "Rewrite the filter as a plain comparison.");
        }
    }
}

inline std::vector<Token> tokenize(const std::string& expr) {
    std::vector<Token> out;
    size_t i = 0, n = expr.size();
    auto push = [&](TokenKind k, std::string text) { out.push_back({k, std::move(text), 0.0}); };

    while (i < n) {
        char c = expr[i];
        if (c == ' ') { ++i; continue; }
        if (c == '(') { push(TokenKind::LPAREN, "("); ++i; continue; }
        if (c == ')') { push(TokenKind::RPAREN, ")"); ++i; continue; }
        if (c == ',') { push(TokenKind::COMMA, ","); ++i; continue; }
        if (c == '&') {
            i += (i + 1 < n && expr[i + 1] == '&') ? 2 : 1;
            push(TokenKind::AND, "&");
            continue;
        }
        if (c == '|') {
            i += (i + 1 < n && expr[i + 1] == '|') ? 2 : 1;
            push(TokenKind::OR, "|");
            continue;
        }
        if (c == '!' || c == '=' || c == '<' || c == '>') {
            bool eq_next = i + 1 < n && expr[i + 1] == '=';
            if (c == '!') { push(eq_next ? TokenKind::NE : TokenKind::NOT, "!"); }
            else if (c == '=') {
                if (!eq_next) throw detail::eval_failed(expr, "single '=' is not a comparison");
                push(TokenKind::EQ, "==");
            }
            else if (c == '<') { push(eq_next ? TokenKind::LE : TokenKind::LT, "<"); }
            else { push(eq_next ? TokenKind::GE : TokenKind::GT, ">"); }
            i += eq_next ? 2 : 1;
            continue;
        }
        if (c == '%') {
            if (expr.compare(i, 4, "%in%") != 0) {
                throw detail::eval_failed(expr, "unknown operator at position " + std::to_string(i));
            }
            push(TokenKind::IN, "%in%");
            i += 4;
            continue;
        }
        if (c == '\'' || c == '"') {
            size_t close = expr.find(c, i + 1);
            if (close == std::string::npos) throw detail::eval_failed(expr, "unterminated string");
            push(TokenKind::STRING, expr.substr(i + 1, close - i - 1));
            i = close + 1;
            continue;
        }
        bool negative_number = c == '-' && i + 1 < n &&
                               (std::isdigit(static_cast<unsigned char>(expr[i + 1])) ||
                                expr[i + 1] == '.');
        if (std::isdigit(static_cast<unsigned char>(c)) || negative_number) {
            size_t start = i++;
            while (i < n && (std::isdigit(static_cast<unsigned char>(expr[i])) || expr[i] == '.' ||
                             expr[i] == 'e' || expr[i] == 'E')) {
                ++i;
            }
            std::string text = expr.substr(start, i - start);
            auto v = text_utils::parse_number(text);
            if (!v.has_value()) throw detail::eval_failed(expr, "bad number '" + text + "'");
            out.push_back({TokenKind::NUMBER, text, *v});
            continue;
        }
        if (detail::ident_start(c)) {
            size_t start = i;
            while (i < n && detail::ident_char(expr[i])) ++i;
            push(TokenKind::IDENT, expr.substr(start, i - start));
            continue;
        }
        throw detail::eval_failed(expr, std::string("unexpected '") + c + "'");
    }
    push(TokenKind::END, "");
    return out;
}

// ---------------------------------------------------------------------------
// Operand / Expr — parsed expression tree, columns bound to the table
// ---------------------------------------------------------------------------
struct Operand {
    enum class Kind { COLUMN, NUMBER, STRING };
    Kind kind = Kind::STRING;
    std::string text;
    double number = 0.0;
    const Column* column = nullptr;
};

struct Expr {
    enum class Op { AND, OR, NOT, COMPARE, IN, IS_NA, CONSTANT };
    Op op = Op::CONSTANT;
    TokenKind cmp = TokenKind::EQ;
    bool constant = false;
    std::unique_ptr<Expr> left;
    std::unique_ptr<Expr> right;
    Operand lhs;
    Operand rhs;
    std::vector<Operand> set;
};

class Parser {
public:
    Parser(std::string expr, const RespondentTable& table)
        : expr_(std::move(expr)), table_(table), tokens_(tokenize(expr_)) {}

    std::unique_ptr<Expr> parse() {
        auto root = parse_or();
        if (peek().kind != TokenKind::END) fail("unexpected '" + peek().text + "'");
        return root;
    }

private:
    const Token& peek() const { return tokens_[pos_]; }
    const Token& take() { return tokens_[pos_++]; }

    [[noreturn]] void fail(const std::string& problem) const {
        throw detail::eval_failed(expr_, problem);
    }

    void expect(TokenKind k, const char* what) {
        if (peek().kind != k) fail(std::string("expected ") + what);
        ++pos_;
    }

    static std::unique_ptr<Expr> binary(Expr::Op op, std::unique_ptr<Expr> l,
                                        std::unique_ptr<Expr> r) {
        auto e = std::make_unique<Expr>();
        e->op = op;
        e->left = std::move(l);
        e->right = std::move(r);
        return e;
    }

    std::unique_ptr<Expr> parse_or() {
        auto left = parse_and();
        while (peek().kind == TokenKind::OR) {
            ++pos_;
            left = binary(Expr::Op::OR, std::move(left), parse_and());
        }
        return left;
    }

    std::unique_ptr<Expr> parse_and() {
        auto left = parse_unary();
        while (peek().kind == TokenKind::AND) {
            ++pos_;
            left = binary(Expr::Op::AND, std::move(left), parse_unary());
        }
        return left;
    }

    std::unique_ptr<Expr> parse_unary() {
        const Token& t = peek();
        if (t.kind == TokenKind::NOT) {
            ++pos_;
            auto e = std::make_unique<Expr>();
            e->op = Expr::Op::NOT;
            e->left = parse_unary();
            return e;
        }
        if (t.kind == TokenKind::LPAREN) {
            ++pos_;
            auto inner = parse_or();
            expect(TokenKind::RPAREN, "')'");
            return inner;
        }
        if (t.kind == TokenKind::IDENT && (t.text == "TRUE" || t.text == "FALSE") &&
            tokens_[pos_ + 1].kind != TokenKind::IN && !is_comparison(tokens_[pos_ + 1].kind)) {
            ++pos_;
            auto e = std::make_unique<Expr>();
            e->op = Expr::Op::CONSTANT;
            e->constant = t.text == "TRUE";
            return e;
        }
        if (t.kind == TokenKind::IDENT && t.text == "is.na" &&
            tokens_[pos_ + 1].kind == TokenKind::LPAREN) {
            pos_ += 2;
            auto e = std::make_unique<Expr>();
            e->op = Expr::Op::IS_NA;
            e->lhs = operand();
            if (e->lhs.kind != Operand::Kind::COLUMN) fail("is.na() takes a column name");
            expect(TokenKind::RPAREN, "')'");
            return e;
        }
        return comparison();
    }

    static bool is_comparison(TokenKind k) {
        return k == TokenKind::EQ || k == TokenKind::NE || k == TokenKind::LT ||
               k == TokenKind::LE || k == TokenKind::GT || k == TokenKind::GE;
    }

    std::unique_ptr<Expr> comparison() {
        auto e = std::make_unique<Expr>();
        e->lhs = operand();
        TokenKind k = peek().kind;
        if (k == TokenKind::IN) {
            ++pos_;
            if (peek().kind != TokenKind::IDENT || peek().text != "c") fail("expected c(...) after %in%");
            ++pos_;
            expect(TokenKind::LPAREN, "'(' after c");
            e->op = Expr::Op::IN;
            if (peek().kind != TokenKind::RPAREN) {
                e->set.push_back(operand());
                while (peek().kind == TokenKind::COMMA) {
                    ++pos_;
                    e->set.push_back(operand());
                }
            }
            expect(TokenKind::RPAREN, "')' closing c(...)");
            return e;
        }
        if (!is_comparison(k)) fail("expected a comparison after '" + e->lhs.text + "'");
        ++pos_;
        e->op = Expr::Op::COMPARE;
        e->cmp = k;
        e->rhs = operand();
        return e;
    }

    Operand operand() {
        const Token& t = take();
        Operand o;
        o.text = t.text;
        switch (t.kind) {
            case TokenKind::NUMBER:
                o.kind = Operand::Kind::NUMBER;
                o.number = t.number;
                return o;
            case TokenKind::STRING:
                o.kind = Operand::Kind::STRING;
                return o;
            case TokenKind::IDENT:
                o.kind = Operand::Kind::COLUMN;
                o.column = table_.find_column(t.text);
                if (!o.column) fail("column '" + t.text + "' not found");
                return o;
            default:
                fail("expected a column or a literal");
        }
    }

    std::string expr_;
    const RespondentTable& table_;
    std::vector<Token> tokens_;
    size_t pos_ = 0;
};

// ---------------------------------------------------------------------------
// Evaluation
// ---------------------------------------------------------------------------
namespace detail {

struct Value {
    bool missing = false;
    std::optional<double> number;
    std::string text;
};

inline Value value_of(const Operand& o, size_t row) {
    Value v;
    switch (o.kind) {
        case Operand::Kind::NUMBER:
            v.number = o.number;
            v.text = text_utils::format_number(o.number);
            return v;
        case Operand::Kind::STRING:
            v.text = o.text;
            v.number = text_utils::parse_number(o.text);
            return v;
        case Operand::Kind::COLUMN:
            if (o.column->is_missing(row)) {
                v.missing = true;
                return v;
            }
            v.text = *o.column->text_at(row);
            v.number = o.column->number_at(row);
            return v;
    }
    return v;
}

template <typename T>
bool compare_values(const T& a, const T& b, TokenKind cmp) {
    switch (cmp) {
        case TokenKind::EQ: return a == b;
        case TokenKind::NE: return a != b;
        case TokenKind::LT: return a < b;
        case TokenKind::LE: return a <= b;
        case TokenKind::GT: return a > b;
        case TokenKind::GE: return a >= b;
        default: return false;
    }
}

inline std::optional<bool> compare(const Value& a, const Value& b, TokenKind cmp) {
    if (a.missing || b.missing) return std::nullopt;
    if (a.number.has_value() && b.number.has_value()) {
        return compare_values(*a.number, *b.number, cmp);
    }
    return compare_values(a.text, b.text, cmp);
}

}  // namespace detail

inline std::optional<bool> evaluate(const Expr& e, size_t row) {
    switch (e.op) {
        case Expr::Op::CONSTANT:
            return e.constant;
        case Expr::Op::NOT: {
            auto v = evaluate(*e.left, row);
            if (!v.has_value()) return std::nullopt;
            return !*v;
        }
        case Expr::Op::AND: {
            auto l = evaluate(*e.left, row);
            if (l.has_value() && !*l) return false;
            auto r = evaluate(*e.right, row);
            if (r.has_value() && !*r) return false;
            if (!l.has_value() || !r.has_value()) return std::nullopt;
            return true;
        }
        case Expr::Op::OR: {
            auto l = evaluate(*e.left, row);
            if (l.has_value() && *l) return true;
            auto r = evaluate(*e.right, row);
            if (r.has_value() && *r) return true;
            if (!l.has_value() || !r.has_value()) return std::nullopt;
            return false;
        }
        case Expr::Op::IS_NA:
            return e.lhs.column->is_missing(row);
        case Expr::Op::COMPARE:
            return detail::compare(detail::value_of(e.lhs, row), detail::value_of(e.rhs, row),
                                   e.cmp);
        case Expr::Op::IN: {
            // %in% never yields NA: a missing value is simply not in the set.
            detail::Value v = detail::value_of(e.lhs, row);
            if (v.missing) return false;
            for (const auto& o : e.set) {
                auto hit = detail::compare(v, detail::value_of(o, row), TokenKind::EQ);
                if (hit.has_value() && *hit) return true;
            }
            return false;
        }
    }
    return std::nullopt;
}

// Logical mask with exactly one entry per table row; NA becomes false.
inline std::vector<bool> evaluate_mask(const std::string& expr, const RespondentTable& table) {
    check_safety(expr);
    Parser parser(expr, table);
    std::unique_ptr<Expr> root = parser.parse();
    std::vector<bool> mask(table.row_count(), false);
    for (size_t r = 0; r < table.row_count(); ++r) {
        auto v = evaluate(*root, r);
        mask[r] = v.has_value() && *v;
    }
    return mask;
}

// Original row indices retained by the question's base filter. An empty
// expression keeps every row.
inline std::vector<size_t> apply_base_filter(const RespondentTable& table,
                                             const std::string& expr,
                                             const std::string& question_code,
                                             Diagnostics& diag) {
    std::string trimmed = text_utils::trim(expr);
    if (trimmed.empty()) return table.all_rows();

    std::vector<bool> mask = evaluate_mask(trimmed, table);
    std::vector<size_t> rows;
    for (size_t r = 0; r < mask.size(); ++r) {
        if (mask[r]) rows.push_back(r);
    }
    if (rows.empty()) {
        diag.warn("filter:" + question_code,
                  "base filter '" + trimmed + "' retains 0 of " +
                      std::to_string(table.row_count()) + " rows");
    }
    return rows;
}

}  // namespace filter
