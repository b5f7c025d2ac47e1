#include "workflow/ConditionParser.hpp"
#include "workflow/TemplateRenderer.hpp"
#include "workflow/WorkflowError.hpp"
#include <cctype>

namespace sysflow {
namespace workflow {

namespace {

bool isIdentStart(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_';
}

bool isIdentChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

const char* describe(ConditionTokenType type) {
    switch (type) {
        case ConditionTokenType::IDENT:  return "identifier";
        case ConditionTokenType::VAR:    return "variable";
        case ConditionTokenType::STRING: return "string";
        case ConditionTokenType::NUMBER: return "number";
        case ConditionTokenType::TRUE_LITERAL:   return "'true'";
        case ConditionTokenType::FALSE_LITERAL:  return "'false'";
        case ConditionTokenType::EQ:     return "'=='";
        case ConditionTokenType::NEQ:    return "'!='";
        case ConditionTokenType::AND:    return "'&&'";
        case ConditionTokenType::OR:     return "'||'";
        case ConditionTokenType::NOT:    return "'!'";
        case ConditionTokenType::LPAREN: return "'('";
        case ConditionTokenType::RPAREN: return "')'";
        case ConditionTokenType::END:    return "end of expression";
    }
    return "token";
}

} // namespace

// ============================================================================
// ConditionTokenizer
// ============================================================================

ConditionTokenizer::ConditionTokenizer(const std::string& input) : m_input(input) {}

void ConditionTokenizer::fail(const std::string& detail) const {
    throw ConditionError(m_input, detail + " at position " + std::to_string(m_pos));
}

void ConditionTokenizer::skipWhitespace() {
    while (m_pos < m_input.size() && std::isspace(static_cast<unsigned char>(m_input[m_pos]))) {
        ++m_pos;
    }
}

ConditionToken ConditionTokenizer::readString(char quote) {
    size_t start = m_pos;
    ++m_pos;  // Opening quote
    std::string value;
    while (m_pos < m_input.size() && m_input[m_pos] != quote) {
        char c = m_input[m_pos];
        if (c == '\\' && m_pos + 1 < m_input.size()) {
            char escaped = m_input[m_pos + 1];
            switch (escaped) {
                case 'n': value += '\n'; break;
                case 't': value += '\t'; break;
                default:  value += escaped; break;
            }
            m_pos += 2;
            continue;
        }
        value += c;
        ++m_pos;
    }
    if (m_pos >= m_input.size()) {
        m_pos = start;
        fail("unterminated string");
    }
    ++m_pos;  // Closing quote
    return ConditionToken{ConditionTokenType::STRING, value, start};
}

ConditionToken ConditionTokenizer::readNumber() {
    size_t start = m_pos;
    if (m_input[m_pos] == '-') ++m_pos;
    bool hasDecimal = false;
    while (m_pos < m_input.size()) {
        char c = m_input[m_pos];
        if (std::isdigit(static_cast<unsigned char>(c))) {
            ++m_pos;
        } else if (c == '.' && !hasDecimal) {
            hasDecimal = true;
            ++m_pos;
        } else {
            break;
        }
    }
    return ConditionToken{ConditionTokenType::NUMBER, m_input.substr(start, m_pos - start), start};
}

ConditionToken ConditionTokenizer::readIdentifier() {
    size_t start = m_pos;
    while (m_pos < m_input.size() && isIdentChar(m_input[m_pos])) {
        ++m_pos;
    }
    std::string word = m_input.substr(start, m_pos - start);
    if (word == "true") return ConditionToken{ConditionTokenType::TRUE_LITERAL, word, start};
    if (word == "false") return ConditionToken{ConditionTokenType::FALSE_LITERAL, word, start};
    return ConditionToken{ConditionTokenType::IDENT, word, start};
}

ConditionToken ConditionTokenizer::readVariable() {
    // ${name}
    size_t start = m_pos;
    size_t close = m_input.find('}', m_pos + 2);
    if (close == std::string::npos) {
        fail("unterminated variable reference");
    }
    std::string name = m_input.substr(m_pos + 2, close - m_pos - 2);
    size_t first = name.find_first_not_of(" \t");
    size_t last = name.find_last_not_of(" \t");
    name = first == std::string::npos ? "" : name.substr(first, last - first + 1);
    if (!TemplateRenderer::isValidName(name)) {
        fail("invalid variable reference '${" + name + "}'");
    }
    m_pos = close + 1;
    return ConditionToken{ConditionTokenType::VAR, name, start};
}

ConditionToken ConditionTokenizer::next() {
    skipWhitespace();

    if (m_pos >= m_input.size()) {
        return ConditionToken{ConditionTokenType::END, "", m_pos};
    }

    size_t start = m_pos;
    char c = m_input[m_pos];
    char following = m_pos + 1 < m_input.size() ? m_input[m_pos + 1] : '\0';

    switch (c) {
        case '(': ++m_pos; return ConditionToken{ConditionTokenType::LPAREN, "(", start};
        case ')': ++m_pos; return ConditionToken{ConditionTokenType::RPAREN, ")", start};
        case '"':
        case '\'':
            return readString(c);
        case '=':
            if (following == '=') {
                m_pos += 2;
                return ConditionToken{ConditionTokenType::EQ, "==", start};
            }
            fail("expected '==' but found '='");
        case '!':
            if (following == '=') {
                m_pos += 2;
                return ConditionToken{ConditionTokenType::NEQ, "!=", start};
            }
            ++m_pos;
            return ConditionToken{ConditionTokenType::NOT, "!", start};
        case '&':
            if (following == '&') {
                m_pos += 2;
                return ConditionToken{ConditionTokenType::AND, "&&", start};
            }
            fail("expected '&&' but found '&'");
        case '|':
            if (following == '|') {
                m_pos += 2;
                return ConditionToken{ConditionTokenType::OR, "||", start};
            }
            fail("expected '||' but found '|'");
        case '$':
            if (following == '{') {
                return readVariable();
            }
            fail("expected '${' but found '$'");
    }

    if (std::isdigit(static_cast<unsigned char>(c)) ||
        (c == '-' && std::isdigit(static_cast<unsigned char>(following)))) {
        return readNumber();
    }

    if (isIdentStart(c)) {
        return readIdentifier();
    }

    fail(std::string("unexpected character '") + c + "'");
}

ConditionToken ConditionTokenizer::peek() {
    size_t savedPos = m_pos;
    ConditionToken tok = next();
    m_pos = savedPos;
    return tok;
}

// ============================================================================
// ConditionParser
// ============================================================================

ConditionNodePtr parseCondition(const std::string& expression) {
    ConditionParser parser(expression);
    return parser.parse();
}

ConditionParser::ConditionParser(const std::string& expression)
    : m_expression(expression), m_tokenizer(expression)
{
    advance();
}

void ConditionParser::advance() {
    m_currentToken = m_tokenizer.next();
}

void ConditionParser::fail(const std::string& detail) const {
    throw ConditionError(m_expression, detail);
}

void ConditionParser::expect(ConditionTokenType type, const std::string& what) {
    if (m_currentToken.type != type) {
        fail("expected " + what + " but found " + describe(m_currentToken.type) +
             " at position " + std::to_string(m_currentToken.position));
    }
    advance();
}

ConditionNodePtr ConditionParser::parse() {
    if (m_currentToken.type == ConditionTokenType::END) {
        fail("empty expression");
    }
    auto root = parseOr();
    if (m_currentToken.type != ConditionTokenType::END) {
        fail(std::string("unexpected ") + describe(m_currentToken.type) +
             " at position " + std::to_string(m_currentToken.position));
    }
    return root;
}

ConditionNodePtr ConditionParser::makeBinary(ConditionNode::Type type,
                                             ConditionNodePtr left,
                                             ConditionNodePtr right) {
    auto node = std::make_shared<ConditionNode>();
    node->type = type;
    node->left = std::move(left);
    node->right = std::move(right);
    return node;
}

void ConditionParser::enterNesting() {
    if (++m_nesting > kMaxNesting) {
        fail("nesting deeper than " + std::to_string(kMaxNesting) +
             " levels at position " + std::to_string(m_currentToken.position));
    }
}

void ConditionParser::countOperator() {
    if (++m_operators > kMaxOperators) {
        fail("more than " + std::to_string(kMaxOperators) +
             " operators at position " + std::to_string(m_currentToken.position));
    }
}

ConditionNodePtr ConditionParser::parseOr() {
    // andExpr ('||' andExpr)*
    auto left = parseAnd();
    while (m_currentToken.type == ConditionTokenType::OR) {
        countOperator();
        advance();
        left = makeBinary(ConditionNode::Type::Or, left, parseAnd());
    }
    return left;
}

ConditionNodePtr ConditionParser::parseAnd() {
    // unary ('&&' unary)*
    auto left = parseUnary();
    while (m_currentToken.type == ConditionTokenType::AND) {
        countOperator();
        advance();
        left = makeBinary(ConditionNode::Type::And, left, parseUnary());
    }
    return left;
}

ConditionNodePtr ConditionParser::parseUnary() {
    // '!' unary | comparison
    if (m_currentToken.type == ConditionTokenType::NOT) {
        enterNesting();
        advance();
        auto operand = parseUnary();
        --m_nesting;
        return makeBinary(ConditionNode::Type::Not, operand, nullptr);
    }
    return parseComparison();
}

ConditionNodePtr ConditionParser::parseComparison() {
    // primary (('==' | '!=') primary)?
    auto left = parsePrimary();
    if (m_currentToken.type == ConditionTokenType::EQ) {
        countOperator();
        advance();
        return makeBinary(ConditionNode::Type::Eq, left, parsePrimary());
    }
    if (m_currentToken.type == ConditionTokenType::NEQ) {
        countOperator();
        advance();
        return makeBinary(ConditionNode::Type::Neq, left, parsePrimary());
    }
    return left;
}

ConditionNodePtr ConditionParser::parsePrimary() {
    auto node = std::make_shared<ConditionNode>();

    switch (m_currentToken.type) {
        case ConditionTokenType::STRING:
        case ConditionTokenType::NUMBER:
            node->type = ConditionNode::Type::Literal;
            node->value = m_currentToken.text;
            advance();
            return node;

        case ConditionTokenType::TRUE_LITERAL:
        case ConditionTokenType::FALSE_LITERAL:
            node->type = ConditionNode::Type::Literal;
            node->value = m_currentToken.text;
            node->isBoolean = true;
            advance();
            return node;

        case ConditionTokenType::IDENT:
        case ConditionTokenType::VAR:
            node->type = ConditionNode::Type::VarRef;
            node->value = m_currentToken.text;
            advance();
            return node;

        case ConditionTokenType::LPAREN: {
            enterNesting();
            advance();
            auto inner = parseOr();
            expect(ConditionTokenType::RPAREN, "')'");
            --m_nesting;
            return inner;
        }

        default:
            fail(std::string("expected a value but found ") + describe(m_currentToken.type) +
                 " at position " + std::to_string(m_currentToken.position));
    }
}

} // namespace workflow
} // namespace sysflow
