#include "expression.hpp"
#include "errors.hpp"
#include "tree.hpp"
#include "util.hpp"
#include <cctype>
#include <cmath>
#include <set>

// ---------------------------------------------------------------------------
// Expressions
// ---------------------------------------------------------------------------

struct Expression::Node {
    enum class Kind { Literal, Path, List, Not, Negate, And, Or, Compare, Filter };

    Kind kind = Kind::Literal;
    nlohmann::json literal;
    std::vector<std::string> segments;
    std::vector<std::shared_ptr<const Node>> children;
    std::string op;
};

namespace {

using NodePtr = std::shared_ptr<const Expression::Node>;
using Kind = Expression::Node::Kind;

enum class TokKind { Ident, Number, String, Op, End };

struct Token {
    TokKind kind = TokKind::End;
    std::string text;
    double number = 0.0;
};

const std::set<std::string> kFilters = {
    "lower", "upper", "trim", "length", "count", "default", "join", "tojson",
    "string", "number", "int", "first", "last", "keys", "replace", "split"
};

bool is_ident_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

std::vector<Token> tokenize(const std::string& src) {
    std::vector<Token> tokens;
    size_t i = 0;
    while (i < src.size()) {
        char c = src[i];
        if (std::isspace(static_cast<unsigned char>(c))) {
            ++i;
            continue;
        }

        if (std::isdigit(static_cast<unsigned char>(c))) {
            size_t start = i;
            while (i < src.size() && std::isdigit(static_cast<unsigned char>(src[i]))) ++i;
            if (i + 1 < src.size() && src[i] == '.' &&
                std::isdigit(static_cast<unsigned char>(src[i + 1]))) {
                ++i;
                while (i < src.size() && std::isdigit(static_cast<unsigned char>(src[i]))) ++i;
            }
            Token t;
            t.kind = TokKind::Number;
            t.text = src.substr(start, i - start);
            t.number = std::stod(t.text);
            tokens.push_back(t);
            continue;
        }

        if (is_ident_start(c)) {
            size_t start = i;
            while (i < src.size()) {
                if (is_ident_char(src[i])) {
                    ++i;
                } else if (src[i] == '-' && i + 1 < src.size() && is_ident_char(src[i + 1])) {
                    // Device trees use dashed names: admin-state
                    ++i;
                } else {
                    break;
                }
            }
            tokens.push_back({TokKind::Ident, src.substr(start, i - start), 0.0});
            continue;
        }

        if (c == '\'' || c == '"') {
            char quote = c;
            std::string value;
            ++i;
            bool closed = false;
            while (i < src.size()) {
                char d = src[i++];
                if (d == '\\' && i < src.size()) {
                    char e = src[i++];
                    switch (e) {
                        case 'n': value += '\n'; break;
                        case 't': value += '\t'; break;
                        default:  value += e;    break;
                    }
                } else if (d == quote) {
                    closed = true;
                    break;
                } else {
                    value += d;
                }
            }
            if (!closed) {
                throw DefinitionError("Unterminated string in expression: " + src);
            }
            tokens.push_back({TokKind::String, value, 0.0});
            continue;
        }

        static const char* two_char_ops[] = {"==", "!=", "<=", ">=", "&&", "||"};
        bool matched = false;
        for (const char* op : two_char_ops) {
            if (src.compare(i, 2, op) == 0) {
                tokens.push_back({TokKind::Op, op, 0.0});
                i += 2;
                matched = true;
                break;
            }
        }
        if (matched) continue;

        static const std::string single_ops = "<>()[],|.!-";
        if (single_ops.find(c) != std::string::npos) {
            tokens.push_back({TokKind::Op, std::string(1, c), 0.0});
            ++i;
            continue;
        }

        throw DefinitionError(std::string("Unexpected character '") + c + "' in expression: " + src);
    }
    tokens.push_back({TokKind::End, "", 0.0});
    return tokens;
}

NodePtr make_node(Kind kind, std::vector<NodePtr> children = {}, std::string op = {}) {
    auto node = std::make_shared<Expression::Node>();
    node->kind = kind;
    node->children = std::move(children);
    node->op = std::move(op);
    return node;
}

NodePtr make_literal(nlohmann::json value) {
    auto node = std::make_shared<Expression::Node>();
    node->kind = Kind::Literal;
    node->literal = std::move(value);
    return node;
}

class Parser {
public:
    Parser(const std::string& source)
        : source_(source), tokens_(tokenize(source)) {}

    NodePtr parse() {
        auto node = parse_or();
        if (peek().kind != TokKind::End) {
            fail("unexpected '" + peek().text + "'");
        }
        return node;
    }

private:
    const Token& peek(size_t ahead = 0) const {
        size_t idx = std::min(pos_ + ahead, tokens_.size() - 1);
        return tokens_[idx];
    }

    const Token& next() {
        const Token& t = tokens_[pos_];
        if (pos_ < tokens_.size() - 1) ++pos_;
        return t;
    }

    bool is_op(const std::string& op, size_t ahead = 0) const {
        return peek(ahead).kind == TokKind::Op && peek(ahead).text == op;
    }

    bool is_word(const std::string& word, size_t ahead = 0) const {
        return peek(ahead).kind == TokKind::Ident && peek(ahead).text == word;
    }

    void expect_op(const std::string& op) {
        if (!is_op(op)) fail("expected '" + op + "'");
        next();
    }

    [[noreturn]] void fail(const std::string& what) const {
        throw DefinitionError("Invalid expression '" + source_ + "': " + what);
    }

    NodePtr parse_or() {
        auto left = parse_and();
        while (is_word("or") || is_op("||")) {
            next();
            left = make_node(Kind::Or, {left, parse_and()});
        }
        return left;
    }

    NodePtr parse_and() {
        auto left = parse_not();
        while (is_word("and") || is_op("&&")) {
            next();
            left = make_node(Kind::And, {left, parse_not()});
        }
        return left;
    }

    NodePtr parse_not() {
        if (is_word("not") || is_op("!")) {
            next();
            return make_node(Kind::Not, {parse_not()});
        }
        return parse_comparison();
    }

    NodePtr parse_comparison() {
        auto left = parse_filter();
        std::string op;
        if (peek().kind == TokKind::Op &&
            (is_op("==") || is_op("!=") || is_op("<") || is_op("<=") || is_op(">") || is_op(">="))) {
            op = next().text;
        } else if (is_word("in") || is_word("contains")) {
            op = next().text;
        } else if (is_word("not") && is_word("in", 1)) {
            next();
            next();
            op = "not in";
        }
        if (op.empty()) return left;
        return make_node(Kind::Compare, {left, parse_filter()}, op);
    }

    NodePtr parse_filter() {
        auto subject = parse_unary();
        while (is_op("|")) {
            next();
            if (peek().kind != TokKind::Ident) fail("expected filter name");
            std::string name = next().text;
            if (kFilters.count(name) == 0) fail("unknown filter '" + name + "'");
            std::vector<NodePtr> children{subject};
            if (is_op("(")) {
                next();
                if (!is_op(")")) {
                    children.push_back(parse_or());
                    while (is_op(",")) {
                        next();
                        children.push_back(parse_or());
                    }
                }
                expect_op(")");
            }
            subject = make_node(Kind::Filter, std::move(children), name);
        }
        return subject;
    }

    NodePtr parse_unary() {
        if (is_op("-")) {
            next();
            return make_node(Kind::Negate, {parse_unary()});
        }
        return parse_primary();
    }

    NodePtr parse_primary() {
        const Token& t = peek();
        switch (t.kind) {
            case TokKind::Number:
                next();
                if (t.text.find('.') == std::string::npos) {
                    return make_literal(static_cast<long long>(t.number));
                }
                return make_literal(t.number);
            case TokKind::String:
                next();
                return make_literal(t.text);
            case TokKind::Ident:
                return parse_identifier();
            case TokKind::Op:
                if (t.text == "(") {
                    next();
                    auto inner = parse_or();
                    expect_op(")");
                    return inner;
                }
                if (t.text == "[") {
                    return parse_list();
                }
                fail("unexpected '" + t.text + "'");
            case TokKind::End:
                fail("unexpected end of input");
        }
        fail("unexpected token");
    }

    NodePtr parse_identifier() {
        std::string word = next().text;
        if (word == "true" || word == "True") return make_literal(true);
        if (word == "false" || word == "False") return make_literal(false);
        if (word == "none" || word == "None" || word == "null") return make_literal(nullptr);

        auto node = std::make_shared<Expression::Node>();
        node->kind = Kind::Path;
        node->segments.push_back(word);
        while (true) {
            if (is_op(".") && (peek(1).kind == TokKind::Ident || peek(1).kind == TokKind::Number)) {
                next();
                node->segments.push_back(next().text);
            } else if (is_op("[") && (peek(1).kind == TokKind::Number || peek(1).kind == TokKind::String)) {
                next();
                node->segments.push_back(next().text);
                expect_op("]");
            } else {
                break;
            }
        }
        return node;
    }

    NodePtr parse_list() {
        expect_op("[");
        std::vector<NodePtr> items;
        if (!is_op("]")) {
            items.push_back(parse_or());
            while (is_op(",")) {
                next();
                items.push_back(parse_or());
            }
        }
        expect_op("]");
        return make_node(Kind::List, std::move(items));
    }

    std::string source_;
    std::vector<Token> tokens_;
    size_t pos_ = 0;
};

nlohmann::json resolve(const nlohmann::json& scope, const std::vector<std::string>& segments) {
    const nlohmann::json* current = &scope;
    for (const auto& seg : segments) {
        if (current->is_object()) {
            auto it = current->find(seg);
            if (it != current->end()) {
                current = &(*it);
                continue;
            }
            const nlohmann::json* match = nullptr;
            for (auto jt = current->begin(); jt != current->end(); ++jt) {
                if (tree::local_name(jt.key()) == seg) {
                    match = &jt.value();
                    break;
                }
            }
            if (!match) return nullptr;
            current = match;
        } else if (current->is_array()) {
            double index = 0;
            if (!util::parse_number(seg, index) || index < 0 ||
                static_cast<size_t>(index) >= current->size()) {
                return nullptr;
            }
            current = &(*current)[static_cast<size_t>(index)];
        } else {
            return nullptr;
        }
    }
    return *current;
}

bool as_number(const nlohmann::json& v, double& out) {
    if (v.is_number()) {
        out = v.get<double>();
        return true;
    }
    if (v.is_string()) {
        return util::parse_number(v.get<std::string>(), out);
    }
    return false;
}

bool values_equal(const nlohmann::json& a, const nlohmann::json& b) {
    if (a.is_null() || b.is_null()) return a.is_null() && b.is_null();
    if (a.is_boolean() || b.is_boolean()) {
        return util::to_lower(tree::canonical_string(a)) == util::to_lower(tree::canonical_string(b));
    }
    double x = 0, y = 0;
    if ((a.is_number() || b.is_number()) && as_number(a, x) && as_number(b, y)) {
        return x == y;
    }
    return tree::canonical_string(a) == tree::canonical_string(b);
}

int compare_order(const nlohmann::json& a, const nlohmann::json& b) {
    double x = 0, y = 0;
    if (as_number(a, x) && as_number(b, y)) {
        return x < y ? -1 : (x > y ? 1 : 0);
    }
    return tree::canonical_string(a).compare(tree::canonical_string(b));
}

bool contains_value(const nlohmann::json& haystack, const nlohmann::json& needle) {
    if (haystack.is_array()) {
        for (const auto& item : haystack) {
            if (values_equal(item, needle)) return true;
        }
        return false;
    }
    if (haystack.is_object()) {
        return haystack.contains(tree::canonical_string(needle));
    }
    if (haystack.is_string()) {
        return haystack.get<std::string>().find(tree::canonical_string(needle)) != std::string::npos;
    }
    return false;
}

nlohmann::json apply_filter(const std::string& name, const nlohmann::json& subject,
                            const std::vector<nlohmann::json>& args) {
    auto arg = [&](size_t i, const nlohmann::json& fallback) -> nlohmann::json {
        return i < args.size() ? args[i] : fallback;
    };

    if (name == "lower") return util::to_lower(tree::canonical_string(subject));
    if (name == "upper") return util::to_upper(tree::canonical_string(subject));
    if (name == "trim") return util::trim(tree::canonical_string(subject));
    if (name == "string") return tree::canonical_string(subject);
    if (name == "tojson") return tree::dump(subject);
    if (name == "length" || name == "count") {
        if (subject.is_array() || subject.is_object()) return subject.size();
        if (subject.is_null()) return 0;
        return tree::canonical_string(subject).size();
    }
    if (name == "default") {
        if (subject.is_null() || (subject.is_string() && subject.get<std::string>().empty())) {
            return arg(0, "");
        }
        return subject;
    }
    if (name == "join") {
        std::string sep = tree::canonical_string(arg(0, ""));
        if (!subject.is_array()) return tree::canonical_string(subject);
        std::vector<std::string> parts;
        for (const auto& item : subject) parts.push_back(tree::canonical_string(item));
        return util::join(parts, sep);
    }
    if (name == "number" || name == "int") {
        double n = 0;
        if (!as_number(subject, n)) return nullptr;
        if (name == "int") return static_cast<long long>(std::floor(n));
        return n;
    }
    if (name == "first" || name == "last") {
        if (subject.is_array() && !subject.empty()) {
            return name == "first" ? subject.front() : subject.back();
        }
        return nullptr;
    }
    if (name == "keys") {
        nlohmann::json keys = nlohmann::json::array();
        if (subject.is_object()) {
            for (auto it = subject.begin(); it != subject.end(); ++it) keys.push_back(it.key());
        }
        return keys;
    }
    if (name == "replace") {
        std::string s = tree::canonical_string(subject);
        std::string from = tree::canonical_string(arg(0, ""));
        std::string to = tree::canonical_string(arg(1, ""));
        if (from.empty()) return s;
        size_t pos = 0;
        while ((pos = s.find(from, pos)) != std::string::npos) {
            s.replace(pos, from.size(), to);
            pos += to.size();
        }
        return s;
    }
    if (name == "split") {
        std::string s = tree::canonical_string(subject);
        std::string sep = tree::canonical_string(arg(0, ","));
        nlohmann::json parts = nlohmann::json::array();
        if (sep.empty()) {
            parts.push_back(s);
            return parts;
        }
        size_t start = 0;
        size_t pos = 0;
        while ((pos = s.find(sep, start)) != std::string::npos) {
            parts.push_back(s.substr(start, pos - start));
            start = pos + sep.size();
        }
        parts.push_back(s.substr(start));
        return parts;
    }
    return subject;
}

nlohmann::json eval_node(const Expression::Node& node, const nlohmann::json& scope) {
    switch (node.kind) {
        case Kind::Literal:
            return node.literal;
        case Kind::Path:
            return resolve(scope, node.segments);
        case Kind::List: {
            nlohmann::json items = nlohmann::json::array();
            for (const auto& child : node.children) items.push_back(eval_node(*child, scope));
            return items;
        }
        case Kind::Not:
            return !tree::is_truthy(eval_node(*node.children[0], scope));
        case Kind::Negate: {
            double n = 0;
            if (!as_number(eval_node(*node.children[0], scope), n)) return nullptr;
            return -n;
        }
        case Kind::And:
            return tree::is_truthy(eval_node(*node.children[0], scope)) &&
                   tree::is_truthy(eval_node(*node.children[1], scope));
        case Kind::Or:
            return tree::is_truthy(eval_node(*node.children[0], scope)) ||
                   tree::is_truthy(eval_node(*node.children[1], scope));
        case Kind::Compare: {
            auto left = eval_node(*node.children[0], scope);
            auto right = eval_node(*node.children[1], scope);
            const auto& op = node.op;
            if (op == "==") return values_equal(left, right);
            if (op == "!=") return !values_equal(left, right);
            if (op == "in") return contains_value(right, left);
            if (op == "not in") return !contains_value(right, left);
            if (op == "contains") return contains_value(left, right);
            if (left.is_null() || right.is_null()) return false;
            int order = compare_order(left, right);
            if (op == "<") return order < 0;
            if (op == "<=") return order <= 0;
            if (op == ">") return order > 0;
            if (op == ">=") return order >= 0;
            return false;
        }
        case Kind::Filter: {
            auto subject = eval_node(*node.children[0], scope);
            std::vector<nlohmann::json> args;
            for (size_t i = 1; i < node.children.size(); ++i) {
                args.push_back(eval_node(*node.children[i], scope));
            }
            return apply_filter(node.op, subject, args);
        }
    }
    return nullptr;
}

} // namespace

Expression::Expression() : root_(make_literal(nullptr)) {}

Expression Expression::parse(const std::string& source) {
    if (util::trim(source).empty()) {
        throw DefinitionError("Empty expression");
    }
    Expression expr;
    expr.source_ = source;
    expr.root_ = Parser(source).parse();
    return expr;
}

nlohmann::json Expression::evaluate(const nlohmann::json& scope) const {
    return eval_node(*root_, scope);
}

bool Expression::test(const nlohmann::json& scope) const {
    return tree::is_truthy(evaluate(scope));
}

// ---------------------------------------------------------------------------
// Templates
// ---------------------------------------------------------------------------

struct Template::Node {
    enum class Kind { Text, Output, If, For };

    Kind kind = Kind::Text;
    std::string text;
    Expression expr;
    std::vector<std::pair<Expression, std::vector<Node>>> branches;
    std::vector<Node> else_body;
    std::string loop_var;
    std::vector<Node> body;
};

namespace {

struct Tag {
    enum class Type { Output, Statement, Comment };
    Type type;
    std::string content;
};

struct Piece {
    bool is_tag = false;
    std::string text;
    Tag tag{Tag::Type::Output, ""};
};

std::vector<Piece> lex_template(const std::string& text) {
    std::vector<Piece> pieces;
    size_t pos = 0;
    bool trim_next = false;

    while (pos < text.size()) {
        size_t open = std::string::npos;
        for (const char* marker : {"{{", "{%", "{#"}) {
            size_t p = text.find(marker, pos);
            if (p < open) open = p;
        }

        std::string chunk = text.substr(pos, open == std::string::npos ? std::string::npos : open - pos);
        if (trim_next) {
            auto first = chunk.find_first_not_of(" \t\r\n");
            chunk = first == std::string::npos ? "" : chunk.substr(first);
            trim_next = false;
        }

        if (open == std::string::npos) {
            if (!chunk.empty()) pieces.push_back({false, chunk, {}});
            break;
        }

        char kind = text[open + 1];
        std::string close = kind == '{' ? "}}" : (kind == '%' ? "%}" : "#}");
        size_t end = text.find(close, open + 2);
        if (end == std::string::npos) {
            throw DefinitionError("Unclosed template tag near: " + text.substr(open, 40));
        }

        std::string inner = text.substr(open + 2, end - open - 2);
        if (!inner.empty() && inner.front() == '-') {
            auto last = chunk.find_last_not_of(" \t\r\n");
            chunk = last == std::string::npos ? "" : chunk.substr(0, last + 1);
            inner.erase(0, 1);
        }
        if (!inner.empty() && inner.back() == '-') {
            trim_next = true;
            inner.pop_back();
        }

        if (!chunk.empty()) pieces.push_back({false, chunk, {}});

        Piece tag_piece;
        tag_piece.is_tag = true;
        tag_piece.tag.type = kind == '{' ? Tag::Type::Output
                           : (kind == '%' ? Tag::Type::Statement : Tag::Type::Comment);
        tag_piece.tag.content = util::trim(inner);
        if (tag_piece.tag.type != Tag::Type::Comment) pieces.push_back(tag_piece);

        pos = end + 2;
    }
    return pieces;
}

std::string first_word(const std::string& s) {
    auto space = s.find_first_of(" \t");
    return space == std::string::npos ? s : s.substr(0, space);
}

std::string rest_after_word(const std::string& s) {
    auto space = s.find_first_of(" \t");
    return space == std::string::npos ? "" : util::trim(s.substr(space));
}

class TemplateParser {
public:
    explicit TemplateParser(std::vector<Piece> pieces) : pieces_(std::move(pieces)) {}

    std::vector<Template::Node> parse_all() {
        std::string stop;
        auto nodes = parse_block({}, stop);
        if (!stop.empty()) {
            throw DefinitionError("Unexpected '{% " + stop + " %}' in template");
        }
        return nodes;
    }

private:
    std::vector<Template::Node> parse_block(const std::set<std::string>& terminators, std::string& stopped_at) {
        std::vector<Template::Node> nodes;
        while (pos_ < pieces_.size()) {
            const Piece& piece = pieces_[pos_];
            if (!piece.is_tag) {
                Template::Node node;
                node.kind = Template::Node::Kind::Text;
                node.text = piece.text;
                nodes.push_back(std::move(node));
                ++pos_;
                continue;
            }
            if (piece.tag.type == Tag::Type::Output) {
                Template::Node node;
                node.kind = Template::Node::Kind::Output;
                node.expr = Expression::parse(piece.tag.content);
                nodes.push_back(std::move(node));
                ++pos_;
                continue;
            }

            std::string word = first_word(piece.tag.content);
            if (terminators.count(word)) {
                stopped_at = word;
                return nodes;
            }
            if (word == "if") {
                nodes.push_back(parse_if());
            } else if (word == "for") {
                nodes.push_back(parse_for());
            } else {
                stopped_at = word;
                return nodes;
            }
        }
        stopped_at.clear();
        return nodes;
    }

    Template::Node parse_if() {
        Template::Node node;
        node.kind = Template::Node::Kind::If;
        auto cond = Expression::parse(rest_after_word(pieces_[pos_].tag.content));
        ++pos_;

        while (true) {
            std::string stop;
            auto body = parse_block({"elif", "else", "endif"}, stop);
            node.branches.emplace_back(cond, std::move(body));
            if (stop == "elif") {
                cond = Expression::parse(rest_after_word(pieces_[pos_].tag.content));
                ++pos_;
                continue;
            }
            if (stop == "else") {
                ++pos_;
                std::string end;
                node.else_body = parse_block({"endif"}, end);
                if (end != "endif") throw DefinitionError("Missing {% endif %} in template");
                ++pos_;
                return node;
            }
            if (stop == "endif") {
                ++pos_;
                return node;
            }
            throw DefinitionError("Missing {% endif %} in template");
        }
    }

    Template::Node parse_for() {
        Template::Node node;
        node.kind = Template::Node::Kind::For;
        std::string spec = rest_after_word(pieces_[pos_].tag.content);
        auto in_pos = spec.find(" in ");
        if (in_pos == std::string::npos) {
            throw DefinitionError("Malformed for tag: " + spec);
        }
        node.loop_var = util::trim(spec.substr(0, in_pos));
        if (node.loop_var.empty()) {
            throw DefinitionError("Malformed for tag: " + spec);
        }
        node.expr = Expression::parse(spec.substr(in_pos + 4));
        ++pos_;

        std::string stop;
        node.body = parse_block({"endfor"}, stop);
        if (stop != "endfor") throw DefinitionError("Missing {% endfor %} in template");
        ++pos_;
        return node;
    }

    std::vector<Piece> pieces_;
    size_t pos_ = 0;
};

void render_nodes(const std::vector<Template::Node>& nodes, const nlohmann::json& scope, std::string& out) {
    for (const auto& node : nodes) {
        switch (node.kind) {
            case Template::Node::Kind::Text:
                out += node.text;
                break;
            case Template::Node::Kind::Output:
                out += tree::canonical_string(node.expr.evaluate(scope));
                break;
            case Template::Node::Kind::If: {
                bool taken = false;
                for (const auto& [cond, body] : node.branches) {
                    if (cond.test(scope)) {
                        render_nodes(body, scope, out);
                        taken = true;
                        break;
                    }
                }
                if (!taken) render_nodes(node.else_body, scope, out);
                break;
            }
            case Template::Node::Kind::For: {
                auto items = node.expr.evaluate(scope);
                if (items.is_object()) {
                    nlohmann::json pairs = nlohmann::json::array();
                    for (auto it = items.begin(); it != items.end(); ++it) {
                        pairs.push_back({{"key", it.key()}, {"value", it.value()}});
                    }
                    items = pairs;
                }
                if (!items.is_array()) break;
                nlohmann::json local = scope.is_object() ? scope : nlohmann::json::object();
                size_t index = 0;
                for (const auto& item : items) {
                    local[node.loop_var] = item;
                    local["loop"] = {
                        {"index", index + 1},
                        {"index0", index},
                        {"first", index == 0},
                        {"last", index + 1 == items.size()}
                    };
                    render_nodes(node.body, local, out);
                    ++index;
                }
                break;
            }
        }
    }
}

} // namespace

Template::Template() : nodes_(std::make_shared<std::vector<Node>>()) {}

Template Template::parse(const std::string& text) {
    Template t;
    t.nodes_ = std::make_shared<std::vector<Node>>(TemplateParser(lex_template(text)).parse_all());
    return t;
}

bool Template::has_markup(const std::string& text) {
    return text.find("{{") != std::string::npos || text.find("{%") != std::string::npos;
}

std::string Template::render(const nlohmann::json& scope) const {
    std::string out;
    render_nodes(*nodes_, scope, out);
    return out;
}

// ---------------------------------------------------------------------------
// Conditions and value rendering
// ---------------------------------------------------------------------------

Condition Condition::parse(const std::string& source) {
    Condition c;
    c.source_ = source;
    if (Template::has_markup(source)) {
        c.templated_ = true;
        c.template_ = Template::parse(source);
    } else {
        c.expression_ = Expression::parse(source);
    }
    return c;
}

bool Condition::evaluate(const nlohmann::json& scope) const {
    if (!templated_) {
        return expression_.test(scope);
    }
    return tree::is_truthy(nlohmann::json(util::trim(template_.render(scope))));
}

namespace {

// "{{ expr }}" with nothing around it
bool single_expression(const std::string& s, std::string& inner) {
    auto t = util::trim(s);
    if (t.size() < 4 || !util::starts_with(t, "{{") || !util::ends_with(t, "}}")) return false;
    auto body = t.substr(2, t.size() - 4);
    if (body.find("{{") != std::string::npos || body.find("}}") != std::string::npos) return false;
    inner = util::trim(body);
    if (!inner.empty() && inner.front() == '-') inner = util::trim(inner.substr(1));
    if (!inner.empty() && inner.back() == '-') inner = util::trim(inner.substr(0, inner.size() - 1));
    return !inner.empty();
}

} // namespace

nlohmann::json render_value(const nlohmann::json& value, const nlohmann::json& scope) {
    if (value.is_string()) {
        const auto& s = value.get_ref<const std::string&>();
        if (!Template::has_markup(s)) return value;
        std::string inner;
        if (single_expression(s, inner)) {
            return Expression::parse(inner).evaluate(scope);
        }
        return Template::parse(s).render(scope);
    }
    if (value.is_array()) {
        nlohmann::json out = nlohmann::json::array();
        for (const auto& item : value) out.push_back(render_value(item, scope));
        return out;
    }
    if (value.is_object()) {
        nlohmann::json out = nlohmann::json::object();
        for (auto it = value.begin(); it != value.end(); ++it) {
            out[it.key()] = render_value(it.value(), scope);
        }
        return out;
    }
    return value;
}

void validate_templates(const nlohmann::json& value) {
    if (value.is_string()) {
        const auto& s = value.get_ref<const std::string&>();
        if (Template::has_markup(s)) Template::parse(s);
        return;
    }
    if (value.is_array() || value.is_object()) {
        for (const auto& item : value) validate_templates(item);
    }
}
