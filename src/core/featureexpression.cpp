#include "core/featureexpression.h"
#include "gdal/geosbridge.h"

#include <QDate>
#include <QDateTime>
#include <QMap>
#include <QRegularExpression>
#include <QtMath>
#include <cmath>
#include <limits>

struct FeatureExpression::Node {
    enum Kind {
        Literal,
        Column,
        Variable,
        Unary,
        Binary,
        In,
        Between,
        Function,
        Case
    };

    Kind kind{Literal};
    QVariant value;
    QString name;
    int op{0};
    bool negate{false};
    QVector<NodePtr> args;
};

typedef FeatureExpression::Node Node;
typedef FeatureExpression::NodePtr NodePtr;

namespace {

enum Operator {
    OpNone,
    OpOr,
    OpAnd,
    OpNot,
    OpNeg,
    OpPos,
    OpEq,
    OpNe,
    OpLt,
    OpGt,
    OpLe,
    OpGe,
    OpLike,
    OpILike,
    OpIs,
    OpIsNot,
    OpPlus,
    OpMinus,
    OpMul,
    OpDiv,
    OpIntDiv,
    OpMod,
    OpPow,
    OpConcat
};

struct FunctionSpec {
    int minArgs;
    int maxArgs; // -1 for variadic
};

const QMap<QString, FunctionSpec>& functionTable()
{
    static const QMap<QString, FunctionSpec> table = {
        // Conditionals
        {"if",        {2, 3}},
        {"coalesce",  {1, -1}},
        {"nullif",    {2, 2}},
        {"try",       {1, 2}},
        // Strings
        {"upper",     {1, 1}},
        {"lower",     {1, 1}},
        {"length",    {1, 1}},
        {"substr",    {2, 3}},
        {"concat",    {1, -1}},
        {"replace",   {3, 3}},
        {"trim",      {1, 1}},
        {"left",      {2, 2}},
        {"right",     {2, 2}},
        // Math
        {"abs",       {1, 1}},
        {"round",     {1, 2}},
        {"floor",     {1, 1}},
        {"ceil",      {1, 1}},
        {"sqrt",      {1, 1}},
        {"sin",       {1, 1}},
        {"cos",       {1, 1}},
        {"tan",       {1, 1}},
        {"log",       {1, 2}},
        {"log10",     {1, 1}},
        {"exp",       {1, 1}},
        {"pow",       {2, 2}},
        // Conversions
        {"to_int",    {1, 1}},
        {"to_real",   {1, 1}},
        {"to_string", {1, 1}},
        {"to_date",   {1, 1}},
        // Date and time
        {"now",       {0, 0}},
        {"day",       {1, 1}},
        {"month",     {1, 1}},
        {"year",      {1, 1}},
        {"hour",      {1, 1}},
        {"minute",    {1, 1}},
        {"second",    {1, 1}}
    };
    return table;
}

const QStringList& variableNames()
{
    static const QStringList names = {"id", "area", "length", "perimeter", "x", "y"};
    return names;
}

// ---------------------------------------------------------------------------
// Tokenizer

struct Token {
    enum Type {
        End,
        Number,
        String,
        Column,
        Identifier,
        Variable,
        Symbol
    };
    Type type{End};
    QString text;
    QVariant value;
    int pos{0};
};

class Tokenizer {
public:
    explicit Tokenizer(const QString& text) : m_text(text) {}

    bool tokenize(QVector<Token>& out, QString& error)
    {
        while (true) {
            skipSpace();
            Token tok;
            tok.pos = m_pos;
            if (m_pos >= m_text.size()) {
                tok.type = Token::End;
                out.append(tok);
                return true;
            }

            const QChar c = m_text.at(m_pos);
            if (c.isDigit() || (c == '.' && peek(1).isDigit())) {
                readNumber(tok);
            } else if (c == '\'') {
                if (!readQuoted('\'', tok.text)) {
                    error = QString("Unterminated string starting at position %1").arg(tok.pos + 1);
                    return false;
                }
                tok.type = Token::String;
            } else if (c == '"') {
                if (!readQuoted('"', tok.text)) {
                    error = QString("Unterminated column name starting at position %1").arg(tok.pos + 1);
                    return false;
                }
                tok.type = Token::Column;
            } else if (c == '$') {
                ++m_pos;
                tok.type = Token::Variable;
                tok.text = readWord();
                if (tok.text.isEmpty()) {
                    error = QString("Expected variable name after '$' at position %1").arg(tok.pos + 1);
                    return false;
                }
            } else if (c.isLetter() || c == '_') {
                tok.type = Token::Identifier;
                tok.text = readWord();
            } else {
                tok.type = Token::Symbol;
                tok.text = readSymbol();
                if (tok.text.isEmpty()) {
                    error = QString("Unexpected character '%1' at position %2").arg(c).arg(tok.pos + 1);
                    return false;
                }
            }
            out.append(tok);
        }
    }

private:
    QChar peek(int offset) const
    {
        const int i = m_pos + offset;
        return i < m_text.size() ? m_text.at(i) : QChar();
    }

    void skipSpace()
    {
        while (m_pos < m_text.size() && m_text.at(m_pos).isSpace()) ++m_pos;
    }

    QString readWord()
    {
        const int start = m_pos;
        while (m_pos < m_text.size() && (m_text.at(m_pos).isLetterOrNumber() || m_text.at(m_pos) == '_')) {
            ++m_pos;
        }
        return m_text.mid(start, m_pos - start);
    }

    void readNumber(Token& tok)
    {
        const int start = m_pos;
        bool isReal = false;
        while (m_pos < m_text.size() && m_text.at(m_pos).isDigit()) ++m_pos;
        if (m_pos < m_text.size() && m_text.at(m_pos) == '.') {
            isReal = true;
            ++m_pos;
            while (m_pos < m_text.size() && m_text.at(m_pos).isDigit()) ++m_pos;
        }
        if (m_pos < m_text.size() && (m_text.at(m_pos) == 'e' || m_text.at(m_pos) == 'E')) {
            int save = m_pos;
            ++m_pos;
            if (m_pos < m_text.size() && (m_text.at(m_pos) == '+' || m_text.at(m_pos) == '-')) ++m_pos;
            if (m_pos < m_text.size() && m_text.at(m_pos).isDigit()) {
                isReal = true;
                while (m_pos < m_text.size() && m_text.at(m_pos).isDigit()) ++m_pos;
            } else {
                m_pos = save;
            }
        }
        tok.type = Token::Number;
        tok.text = m_text.mid(start, m_pos - start);
        bool ok = false;
        if (!isReal) {
            qlonglong v = tok.text.toLongLong(&ok);
            if (ok) {
                tok.value = v;
                return;
            }
        }
        tok.value = tok.text.toDouble();
    }

    bool readQuoted(QChar quote, QString& out)
    {
        ++m_pos; // opening quote
        while (m_pos < m_text.size()) {
            const QChar c = m_text.at(m_pos);
            if (c == quote) {
                if (peek(1) == quote) {
                    out.append(quote);
                    m_pos += 2;
                    continue;
                }
                ++m_pos;
                return true;
            }
            if (c == '\\' && quote == '\'' && m_pos + 1 < m_text.size()) {
                const QChar n = m_text.at(m_pos + 1);
                if (n == 'n') out.append('\n');
                else if (n == 't') out.append('\t');
                else out.append(n);
                m_pos += 2;
                continue;
            }
            out.append(c);
            ++m_pos;
        }
        return false;
    }

    QString readSymbol()
    {
        static const QStringList twoChar = {"//", "||", "!=", "<>", "<=", ">=", "=="};
        const QString two = m_text.mid(m_pos, 2);
        if (twoChar.contains(two)) {
            m_pos += 2;
            return two;
        }
        static const QString single = "()+-*/%^=<>,";
        const QChar c = m_text.at(m_pos);
        if (single.contains(c)) {
            ++m_pos;
            return QString(c);
        }
        return QString();
    }

    QString m_text;
    int m_pos{0};
};

// ---------------------------------------------------------------------------
// Parser

class Parser {
public:
    explicit Parser(const QVector<Token>& tokens) : m_tokens(tokens) {}

    NodePtr parse(QString& error)
    {
        NodePtr root = parseOr();
        if (!m_error.isEmpty()) {
            error = m_error;
            return NodePtr();
        }
        if (current().type != Token::End) {
            error = QString("Unexpected '%1' at position %2").arg(current().text).arg(current().pos + 1);
            return NodePtr();
        }
        return root;
    }

private:
    const Token& current() const { return m_tokens.at(m_index); }
    const Token& lookahead(int n) const
    {
        const int i = qMin(m_index + n, m_tokens.size() - 1);
        return m_tokens.at(i);
    }
    void advance() { if (m_index < m_tokens.size() - 1) ++m_index; }

    bool isKeyword(const Token& tok, const char* keyword) const
    {
        return tok.type == Token::Identifier && tok.text.compare(QLatin1String(keyword), Qt::CaseInsensitive) == 0;
    }
    bool isSymbol(const Token& tok, const char* symbol) const
    {
        return tok.type == Token::Symbol && tok.text == QLatin1String(symbol);
    }
    bool acceptKeyword(const char* keyword)
    {
        if (!isKeyword(current(), keyword)) return false;
        advance();
        return true;
    }
    bool acceptSymbol(const char* symbol)
    {
        if (!isSymbol(current(), symbol)) return false;
        advance();
        return true;
    }
    bool expectSymbol(const char* symbol)
    {
        if (acceptSymbol(symbol)) return true;
        fail(QString("Expected '%1'").arg(QLatin1String(symbol)));
        return false;
    }
    void fail(const QString& message)
    {
        if (!m_error.isEmpty()) return;
        const Token& tok = current();
        if (tok.type == Token::End) {
            m_error = QString("%1 at end of expression").arg(message);
        } else {
            m_error = QString("%1 near '%2' at position %3").arg(message, tok.text).arg(tok.pos + 1);
        }
    }

    static NodePtr makeBinary(int op, const NodePtr& l, const NodePtr& r)
    {
        NodePtr n(new Node);
        n->kind = Node::Binary;
        n->op = op;
        n->args << l << r;
        return n;
    }
    static NodePtr makeUnary(int op, const NodePtr& child)
    {
        NodePtr n(new Node);
        n->kind = Node::Unary;
        n->op = op;
        n->args << child;
        return n;
    }

    NodePtr parseOr()
    {
        NodePtr left = parseAnd();
        while (m_error.isEmpty() && acceptKeyword("OR")) {
            left = makeBinary(OpOr, left, parseAnd());
        }
        return left;
    }

    NodePtr parseAnd()
    {
        NodePtr left = parseNot();
        while (m_error.isEmpty() && acceptKeyword("AND")) {
            left = makeBinary(OpAnd, left, parseNot());
        }
        return left;
    }

    NodePtr parseNot()
    {
        if (acceptKeyword("NOT")) return makeUnary(OpNot, parseNot());
        return parseComparison();
    }

    NodePtr parseComparison()
    {
        NodePtr left = parseConcat();
        while (m_error.isEmpty()) {
            const Token& tok = current();
            int op = OpNone;
            if (isSymbol(tok, "=") || isSymbol(tok, "==")) op = OpEq;
            else if (isSymbol(tok, "!=") || isSymbol(tok, "<>")) op = OpNe;
            else if (isSymbol(tok, "<")) op = OpLt;
            else if (isSymbol(tok, ">")) op = OpGt;
            else if (isSymbol(tok, "<=")) op = OpLe;
            else if (isSymbol(tok, ">=")) op = OpGe;

            if (op != OpNone) {
                advance();
                left = makeBinary(op, left, parseConcat());
                continue;
            }

            bool negate = false;
            if (isKeyword(tok, "NOT") && (isKeyword(lookahead(1), "LIKE") || isKeyword(lookahead(1), "ILIKE")
                                          || isKeyword(lookahead(1), "IN") || isKeyword(lookahead(1), "BETWEEN"))) {
                negate = true;
                advance();
            }

            if (isKeyword(current(), "LIKE") || isKeyword(current(), "ILIKE")) {
                op = isKeyword(current(), "ILIKE") ? OpILike : OpLike;
                advance();
                NodePtr like = makeBinary(op, left, parseConcat());
                left = negate ? makeUnary(OpNot, like) : like;
                continue;
            }

            if (acceptKeyword("IN")) {
                if (!expectSymbol("(")) return left;
                NodePtr in(new Node);
                in->kind = Node::In;
                in->negate = negate;
                in->args << left;
                if (!isSymbol(current(), ")")) {
                    do {
                        in->args << parseOr();
                    } while (m_error.isEmpty() && acceptSymbol(","));
                }
                if (!expectSymbol(")")) return left;
                left = in;
                continue;
            }

            if (acceptKeyword("BETWEEN")) {
                NodePtr between(new Node);
                between->kind = Node::Between;
                between->negate = negate;
                between->args << left << parseConcat();
                if (!acceptKeyword("AND")) {
                    fail("Expected AND in BETWEEN");
                    return left;
                }
                between->args << parseConcat();
                left = between;
                continue;
            }

            if (negate) {
                fail("Expected LIKE, ILIKE, IN or BETWEEN after NOT");
                return left;
            }

            if (acceptKeyword("IS")) {
                const int isOp = acceptKeyword("NOT") ? OpIsNot : OpIs;
                left = makeBinary(isOp, left, parseConcat());
                continue;
            }
            break;
        }
        return left;
    }

    NodePtr parseConcat()
    {
        NodePtr left = parseAdditive();
        while (m_error.isEmpty() && acceptSymbol("||")) {
            left = makeBinary(OpConcat, left, parseAdditive());
        }
        return left;
    }

    NodePtr parseAdditive()
    {
        NodePtr left = parseMultiplicative();
        while (m_error.isEmpty()) {
            if (acceptSymbol("+")) left = makeBinary(OpPlus, left, parseMultiplicative());
            else if (acceptSymbol("-")) left = makeBinary(OpMinus, left, parseMultiplicative());
            else break;
        }
        return left;
    }

    NodePtr parseMultiplicative()
    {
        NodePtr left = parseUnary();
        while (m_error.isEmpty()) {
            if (acceptSymbol("*")) left = makeBinary(OpMul, left, parseUnary());
            else if (acceptSymbol("//")) left = makeBinary(OpIntDiv, left, parseUnary());
            else if (acceptSymbol("/")) left = makeBinary(OpDiv, left, parseUnary());
            else if (acceptSymbol("%")) left = makeBinary(OpMod, left, parseUnary());
            else break;
        }
        return left;
    }

    NodePtr parseUnary()
    {
        if (acceptSymbol("-")) return makeUnary(OpNeg, parseUnary());
        if (acceptSymbol("+")) return makeUnary(OpPos, parseUnary());
        return parsePower();
    }

    NodePtr parsePower()
    {
        NodePtr base = parsePrimary();
        if (m_error.isEmpty() && acceptSymbol("^")) {
            return makeBinary(OpPow, base, parseUnary());
        }
        return base;
    }

    NodePtr parsePrimary()
    {
        const Token tok = current();
        NodePtr n(new Node);

        switch (tok.type) {
            case Token::Number:
            case Token::String:
                advance();
                n->kind = Node::Literal;
                n->value = tok.type == Token::String ? QVariant(tok.text) : tok.value;
                return n;

            case Token::Column:
                advance();
                n->kind = Node::Column;
                n->name = tok.text;
                return n;

            case Token::Variable:
                advance();
                if (!variableNames().contains(tok.text.toLower())) {
                    m_error = QString("Unknown variable '$%1' at position %2").arg(tok.text).arg(tok.pos + 1);
                    return n;
                }
                n->kind = Node::Variable;
                n->name = tok.text.toLower();
                return n;

            case Token::Symbol:
                if (acceptSymbol("(")) {
                    NodePtr inner = parseOr();
                    expectSymbol(")");
                    return inner;
                }
                fail("Unexpected symbol");
                return n;

            case Token::Identifier:
                return parseIdentifier();

            case Token::End:
                fail("Unexpected end of expression");
                return n;
        }
        return n;
    }

    NodePtr parseIdentifier()
    {
        const Token tok = current();
        NodePtr n(new Node);

        if (isKeyword(tok, "NULL")) {
            advance();
            n->kind = Node::Literal;
            return n;
        }
        if (isKeyword(tok, "TRUE") || isKeyword(tok, "FALSE")) {
            advance();
            n->kind = Node::Literal;
            n->value = isKeyword(tok, "TRUE");
            return n;
        }
        if (isKeyword(tok, "CASE")) {
            advance();
            return parseCase();
        }

        static const char* reserved[] = {"AND", "OR", "NOT", "LIKE", "ILIKE", "IN", "IS",
                                         "BETWEEN", "WHEN", "THEN", "ELSE", "END"};
        for (const char* word : reserved) {
            if (isKeyword(tok, word)) {
                fail("Unexpected keyword");
                return n;
            }
        }

        advance();
        if (!isSymbol(current(), "(")) {
            // Bare identifiers are column references
            n->kind = Node::Column;
            n->name = tok.text;
            return n;
        }

        advance(); // '('
        const QString name = tok.text.toLower();
        auto spec = functionTable().constFind(name);
        if (spec == functionTable().constEnd()) {
            m_error = QString("Unknown function '%1' at position %2").arg(tok.text).arg(tok.pos + 1);
            return n;
        }

        n->kind = Node::Function;
        n->name = name;
        if (!isSymbol(current(), ")")) {
            do {
                n->args << parseOr();
            } while (m_error.isEmpty() && acceptSymbol(","));
        }
        if (!expectSymbol(")")) return n;

        const int count = n->args.size();
        if (count < spec->minArgs || (spec->maxArgs >= 0 && count > spec->maxArgs)) {
            QString expected;
            if (spec->maxArgs < 0) expected = QString("at least %1").arg(spec->minArgs);
            else if (spec->minArgs == spec->maxArgs) expected = QString::number(spec->minArgs);
            else expected = QString("%1 to %2").arg(spec->minArgs).arg(spec->maxArgs);
            m_error = QString("Function '%1' expects %2 argument(s), got %3").arg(name, expected).arg(count);
        }
        return n;
    }

    NodePtr parseCase()
    {
        NodePtr n(new Node);
        n->kind = Node::Case;
        if (!isKeyword(current(), "WHEN")) {
            fail("Expected WHEN after CASE");
            return n;
        }
        while (m_error.isEmpty() && acceptKeyword("WHEN")) {
            n->args << parseOr();
            if (!acceptKeyword("THEN")) {
                fail("Expected THEN");
                return n;
            }
            n->args << parseOr();
        }
        if (acceptKeyword("ELSE")) {
            n->negate = true; // has ELSE branch
            n->args << parseOr();
        }
        if (!acceptKeyword("END")) fail("Expected END to close CASE");
        return n;
    }

    QVector<Token> m_tokens;
    int m_index{0};
    QString m_error;
};

// ---------------------------------------------------------------------------
// Value helpers

bool isNullValue(const QVariant& v)
{
    return !v.isValid() || v.isNull();
}

bool isIntegerType(const QVariant& v)
{
    switch (v.userType()) {
        case QMetaType::Int:
        case QMetaType::UInt:
        case QMetaType::LongLong:
        case QMetaType::ULongLong:
        case QMetaType::Bool:
            return true;
        default:
            return false;
    }
}

bool isStringType(const QVariant& v)
{
    return v.userType() == QMetaType::QString;
}

bool toDouble(const QVariant& v, double* out)
{
    if (isNullValue(v)) return false;
    if (v.userType() == QMetaType::Double || v.userType() == QMetaType::Float || isIntegerType(v)) {
        *out = v.toDouble();
        return true;
    }
    if (isStringType(v)) {
        bool ok = false;
        double d = v.toString().trimmed().toDouble(&ok);
        if (ok) *out = d;
        return ok;
    }
    return false;
}

bool toInteger(const QVariant& v, qlonglong* out)
{
    if (isNullValue(v)) return false;
    if (isIntegerType(v)) {
        *out = v.toLongLong();
        return true;
    }
    if (isStringType(v)) {
        bool ok = false;
        qlonglong i = v.toString().trimmed().toLongLong(&ok);
        if (ok) *out = i;
        return ok;
    }
    return false;
}

// Whole number as an integer when it fits, as a double otherwise
QVariant integralResult(double value)
{
    qlonglong i = 0;
    if (doubleToInteger(value, &i)) return QVariant(i);
    if (std::isfinite(value)) return QVariant(value);
    return QVariant();
}

QString toText(const QVariant& v)
{
    return displayString(v);
}

QDateTime toDateTime(const QVariant& v)
{
    if (v.userType() == QMetaType::QDateTime) return v.toDateTime();
    if (v.userType() == QMetaType::QDate) return QDateTime(v.toDate(), QTime(0, 0));
    const QString text = v.toString().trimmed();
    QDateTime dt = QDateTime::fromString(text, Qt::ISODate);
    if (dt.isValid()) return dt;
    QDate d = QDate::fromString(text, Qt::ISODate);
    if (d.isValid()) return QDateTime(d, QTime(0, 0));
    return QDateTime();
}

// -1 NULL, 0 false, 1 true
int toTriBool(const QVariant& v)
{
    if (isNullValue(v)) return -1;
    if (v.userType() == QMetaType::Bool) return v.toBool() ? 1 : 0;
    double d = 0.0;
    if (toDouble(v, &d)) return d != 0.0 ? 1 : 0;
    if (isStringType(v)) return v.toString().isEmpty() ? 0 : 1;
    return 1;
}

QVariant fromTriBool(int value)
{
    if (value < 0) return QVariant();
    return QVariant(value == 1);
}

// Three-way compare: numbers numerically, dates chronologically, otherwise as text
int compareValues(const QVariant& a, const QVariant& b)
{
    double da = 0.0, db = 0.0;
    if (toDouble(a, &da) && toDouble(b, &db)) {
        if (da < db) return -1;
        if (da > db) return 1;
        return 0;
    }
    const bool aDate = a.userType() == QMetaType::QDate || a.userType() == QMetaType::QDateTime;
    const bool bDate = b.userType() == QMetaType::QDate || b.userType() == QMetaType::QDateTime;
    if (aDate || bDate) {
        QDateTime ta = toDateTime(a);
        QDateTime tb = toDateTime(b);
        if (ta.isValid() && tb.isValid()) {
            if (ta < tb) return -1;
            if (ta > tb) return 1;
            return 0;
        }
    }
    const int c = toText(a).compare(toText(b));
    return c < 0 ? -1 : (c > 0 ? 1 : 0);
}

QRegularExpression likeToRegex(const QString& pattern, bool caseInsensitive)
{
    QString rx = "^";
    for (int i = 0; i < pattern.size(); ++i) {
        const QChar c = pattern.at(i);
        if (c == '\\' && i + 1 < pattern.size()) {
            rx += QRegularExpression::escape(QString(pattern.at(++i)));
        } else if (c == '%') {
            rx += ".*";
        } else if (c == '_') {
            rx += ".";
        } else {
            rx += QRegularExpression::escape(QString(c));
        }
    }
    rx += "$";
    QRegularExpression::PatternOptions options = QRegularExpression::DotMatchesEverythingOption;
    if (caseInsensitive) options |= QRegularExpression::CaseInsensitiveOption;
    return QRegularExpression(rx, options);
}

// ---------------------------------------------------------------------------
// Evaluator

class Evaluator {
public:
    explicit Evaluator(const ExpressionContext& context) : m_context(context) {}

    QString error() const { return m_error; }

    QVariant eval(const NodePtr& node)
    {
        if (!m_error.isEmpty() || !node) return QVariant();

        switch (node->kind) {
            case Node::Literal:  return node->value;
            case Node::Column:   return evalColumn(node->name);
            case Node::Variable: return evalVariable(node->name);
            case Node::Unary:    return evalUnary(node);
            case Node::Binary:   return evalBinary(node);
            case Node::In:       return evalIn(node);
            case Node::Between:  return evalBetween(node);
            case Node::Function: return evalFunction(node);
            case Node::Case:     return evalCase(node);
        }
        return QVariant();
    }

private:
    QVariant setError(const QString& message)
    {
        if (m_error.isEmpty()) m_error = message;
        return QVariant();
    }

    QVariant evalColumn(const QString& name)
    {
        const int index = m_context.fields ? m_context.fields->indexFromName(name) : -1;
        if (index < 0) return setError(QString("Column '%1' not found").arg(name));
        return m_context.feature.attribute(index);
    }

    QVariant evalVariable(const QString& name)
    {
        const FeatureGeometry& g = m_context.feature.geometry;
        if (name == "id") return QVariant(static_cast<qlonglong>(m_context.feature.id));
        if (g.isNull()) return QVariant();
        if (name == "area") return GeosBridge::area(g);
        if (name == "length") return GeosBridge::length(g);
        if (name == "perimeter") return GeosBridge::perimeter(g);
        if (name == "x" || name == "y") {
            if (g.type != GeometryType::Point) return QVariant();
            const QPointF p = g.parts.first().rings.value(0).value(0);
            return name == "x" ? p.x() : p.y();
        }
        return setError(QString("Unknown variable '$%1'").arg(name));
    }

    QVariant numberOrError(const QVariant& v, double* out)
    {
        if (!toDouble(v, out)) {
            setError(QString("Cannot convert '%1' to a number").arg(toText(v)));
            return QVariant();
        }
        return QVariant(*out);
    }

    QVariant evalUnary(const NodePtr& node)
    {
        const QVariant v = eval(node->args.first());
        if (!m_error.isEmpty()) return QVariant();

        switch (node->op) {
            case OpNot: {
                const int t = toTriBool(v);
                return t < 0 ? QVariant() : QVariant(t == 0);
            }
            case OpNeg:
            case OpPos: {
                if (isNullValue(v)) return QVariant();
                qlonglong i = 0;
                if (isIntegerType(v) && toInteger(v, &i)) {
                    if (node->op == OpPos) return QVariant(i);
                    if (i != std::numeric_limits<qlonglong>::min()) return QVariant(-i);
                }
                double d = 0.0;
                if (!toDouble(v, &d)) return setError(QString("Cannot convert '%1' to a number").arg(toText(v)));
                return QVariant(node->op == OpNeg ? -d : d);
            }
            default:
                break;
        }
        return QVariant();
    }

    QVariant evalLogical(const NodePtr& node)
    {
        const int left = toTriBool(eval(node->args.at(0)));
        if (!m_error.isEmpty()) return QVariant();

        if (node->op == OpAnd) {
            if (left == 0) return false;
            const int right = toTriBool(eval(node->args.at(1)));
            if (!m_error.isEmpty()) return QVariant();
            if (right == 0) return false;
            if (left < 0 || right < 0) return QVariant();
            return true;
        }

        if (left == 1) return true;
        const int right = toTriBool(eval(node->args.at(1)));
        if (!m_error.isEmpty()) return QVariant();
        if (right == 1) return true;
        if (left < 0 || right < 0) return QVariant();
        return false;
    }

    QVariant evalArithmetic(int op, const QVariant& l, const QVariant& r)
    {
        if (isNullValue(l) || isNullValue(r)) return QVariant();

        if (op == OpPlus && isStringType(l) && isStringType(r)) {
            return QVariant(l.toString() + r.toString());
        }

        qlonglong il = 0, ir = 0;
        const bool ints = toInteger(l, &il) && toInteger(r, &ir);
        if (ints && op != OpDiv && op != OpPow) {
            qlonglong result = 0;
            switch (op) {
                case OpPlus:
                    if (!__builtin_add_overflow(il, ir, &result)) return QVariant(result);
                    break;
                case OpMinus:
                    if (!__builtin_sub_overflow(il, ir, &result)) return QVariant(result);
                    break;
                case OpMul:
                    if (!__builtin_mul_overflow(il, ir, &result)) return QVariant(result);
                    break;
                case OpIntDiv:
                    if (ir == 0) return QVariant();
                    if (ir == -1 && il == std::numeric_limits<qlonglong>::min()) break;
                    result = il / ir;
                    if (il % ir != 0 && ((il < 0) != (ir < 0))) --result;
                    return QVariant(result);
                case OpMod:
                    if (ir == 0) return QVariant();
                    if (ir == -1) return QVariant(qlonglong(0));
                    return QVariant(il % ir);
                default:
                    break;
            }
            // Out of the integer range, carry on in floating point
        }

        double dl = 0.0, dr = 0.0;
        if (!toDouble(l, &dl)) return setError(QString("Cannot convert '%1' to a number").arg(toText(l)));
        if (!toDouble(r, &dr)) return setError(QString("Cannot convert '%1' to a number").arg(toText(r)));

        switch (op) {
            case OpPlus:  return QVariant(dl + dr);
            case OpMinus: return QVariant(dl - dr);
            case OpMul:   return QVariant(dl * dr);
            case OpDiv:
                if (dr == 0.0) return QVariant();
                return QVariant(dl / dr);
            case OpIntDiv:
                if (dr == 0.0) return QVariant();
                return integralResult(std::floor(dl / dr));
            case OpMod:
                if (dr == 0.0) return QVariant();
                return QVariant(std::fmod(dl, dr));
            case OpPow:
                return QVariant(std::pow(dl, dr));
            default:
                break;
        }
        return QVariant();
    }

    QVariant evalBinary(const NodePtr& node)
    {
        if (node->op == OpAnd || node->op == OpOr) return evalLogical(node);

        const QVariant l = eval(node->args.at(0));
        const QVariant r = eval(node->args.at(1));
        if (!m_error.isEmpty()) return QVariant();

        switch (node->op) {
            case OpEq:
            case OpNe:
            case OpLt:
            case OpGt:
            case OpLe:
            case OpGe: {
                if (isNullValue(l) || isNullValue(r)) return QVariant();
                const int c = compareValues(l, r);
                switch (node->op) {
                    case OpEq: return c == 0;
                    case OpNe: return c != 0;
                    case OpLt: return c < 0;
                    case OpGt: return c > 0;
                    case OpLe: return c <= 0;
                    default:   return c >= 0;
                }
            }
            case OpIs:
            case OpIsNot: {
                bool same;
                if (isNullValue(l) || isNullValue(r)) same = isNullValue(l) && isNullValue(r);
                else same = compareValues(l, r) == 0;
                return node->op == OpIs ? same : !same;
            }
            case OpLike:
            case OpILike: {
                if (isNullValue(l) || isNullValue(r)) return QVariant();
                return likeToRegex(toText(r), node->op == OpILike).match(toText(l)).hasMatch();
            }
            case OpConcat:
                if (isNullValue(l) || isNullValue(r)) return QVariant();
                return QVariant(toText(l) + toText(r));
            default:
                return evalArithmetic(node->op, l, r);
        }
    }

    QVariant evalIn(const NodePtr& node)
    {
        const QVariant v = eval(node->args.first());
        if (!m_error.isEmpty()) return QVariant();
        if (isNullValue(v)) return QVariant();

        bool sawNull = false;
        for (int i = 1; i < node->args.size(); ++i) {
            const QVariant item = eval(node->args.at(i));
            if (!m_error.isEmpty()) return QVariant();
            if (isNullValue(item)) {
                sawNull = true;
                continue;
            }
            if (compareValues(v, item) == 0) return !node->negate;
        }
        if (sawNull) return QVariant();
        return node->negate;
    }

    QVariant evalBetween(const NodePtr& node)
    {
        const QVariant v = eval(node->args.at(0));
        const QVariant lo = eval(node->args.at(1));
        const QVariant hi = eval(node->args.at(2));
        if (!m_error.isEmpty()) return QVariant();
        if (isNullValue(v) || isNullValue(lo) || isNullValue(hi)) return QVariant();

        const bool inside = compareValues(v, lo) >= 0 && compareValues(v, hi) <= 0;
        return node->negate ? !inside : inside;
    }

    QVariant evalCase(const NodePtr& node)
    {
        const int pairs = (node->args.size() - (node->negate ? 1 : 0)) / 2;
        for (int i = 0; i < pairs; ++i) {
            const QVariant cond = eval(node->args.at(i * 2));
            if (!m_error.isEmpty()) return QVariant();
            if (toTriBool(cond) == 1) return eval(node->args.at(i * 2 + 1));
        }
        if (node->negate) return eval(node->args.last());
        return QVariant();
    }

    QVariant evalFunction(const NodePtr& node)
    {
        const QString& name = node->name;
        const QVector<NodePtr>& a = node->args;

        // Lazily evaluated
        if (name == "if") {
            const QVariant cond = eval(a.at(0));
            if (!m_error.isEmpty()) return QVariant();
            if (toTriBool(cond) == 1) return eval(a.at(1));
            return a.size() > 2 ? eval(a.at(2)) : QVariant();
        }
        if (name == "try") {
            const QVariant v = eval(a.at(0));
            if (m_error.isEmpty()) return v;
            m_error.clear();
            return a.size() > 1 ? eval(a.at(1)) : QVariant();
        }
        if (name == "coalesce") {
            for (const auto& arg : a) {
                const QVariant v = eval(arg);
                if (!m_error.isEmpty()) return QVariant();
                if (!isNullValue(v)) return v;
            }
            return QVariant();
        }

        QVector<QVariant> v;
        v.reserve(a.size());
        for (const auto& arg : a) {
            v.append(eval(arg));
            if (!m_error.isEmpty()) return QVariant();
        }

        if (name == "nullif") {
            if (!isNullValue(v[0]) && !isNullValue(v[1]) && compareValues(v[0], v[1]) == 0) return QVariant();
            return v[0];
        }
        if (name == "concat") {
            QString out;
            for (const auto& item : v) out += toText(item);
            return out;
        }
        if (name == "now") return QDateTime::currentDateTime();

        // Everything below propagates NULL from its first argument
        if (isNullValue(v[0])) return QVariant();

        if (name == "upper") return toText(v[0]).toUpper();
        if (name == "lower") return toText(v[0]).toLower();
        if (name == "trim") return toText(v[0]).trimmed();
        if (name == "length") return QVariant(static_cast<qlonglong>(toText(v[0]).size()));
        if (name == "replace") {
            if (isNullValue(v[1]) || isNullValue(v[2])) return QVariant();
            return toText(v[0]).replace(toText(v[1]), toText(v[2]));
        }
        if (name == "left" || name == "right") {
            qlonglong n = 0;
            if (!toInteger(v[1], &n)) return setError(QString("Cannot convert '%1' to an integer").arg(toText(v[1])));
            const QString s = toText(v[0]);
            const int count = static_cast<int>(qBound<qlonglong>(0, n, s.size()));
            return name == "left" ? s.left(count) : s.right(count);
        }
        if (name == "substr") {
            const QString s = toText(v[0]);
            qlonglong start = 0;
            if (!toInteger(v[1], &start)) return setError(QString("Cannot convert '%1' to an integer").arg(toText(v[1])));
            // 1-based; negative counts from the end
            start = qBound<qlonglong>(-s.size() - 1, start, s.size() + 1);
            const int from = start > 0 ? static_cast<int>(start) - 1
                                       : (start < 0 ? qMax(0, s.size() + static_cast<int>(start)) : 0);
            if (v.size() > 2 && !isNullValue(v[2])) {
                qlonglong len = 0;
                if (!toInteger(v[2], &len)) return setError(QString("Cannot convert '%1' to an integer").arg(toText(v[2])));
                if (len < 0) return QString();
                return s.mid(from, static_cast<int>(qMin<qlonglong>(len, s.size())));
            }
            return s.mid(from);
        }

        if (name == "to_string") return toText(v[0]);
        if (name == "to_int") {
            qlonglong i = 0;
            if (toInteger(v[0], &i)) return i;
            double d = 0.0;
            if (toDouble(v[0], &d) && doubleToInteger(d, &i)) return i;
            return setError(QString("Cannot convert '%1' to an integer").arg(toText(v[0])));
        }
        if (name == "to_real") {
            double d = 0.0;
            if (toDouble(v[0], &d)) return d;
            return setError(QString("Cannot convert '%1' to a real number").arg(toText(v[0])));
        }
        if (name == "to_date") {
            const QDateTime dt = toDateTime(v[0]);
            if (!dt.isValid()) return setError(QString("Cannot convert '%1' to a date").arg(toText(v[0])));
            return dt.date();
        }

        if (name == "day" || name == "month" || name == "year"
            || name == "hour" || name == "minute" || name == "second") {
            const QDateTime dt = toDateTime(v[0]);
            if (!dt.isValid()) return setError(QString("Cannot convert '%1' to a date").arg(toText(v[0])));
            if (name == "day") return dt.date().day();
            if (name == "month") return dt.date().month();
            if (name == "year") return dt.date().year();
            if (name == "hour") return dt.time().hour();
            if (name == "minute") return dt.time().minute();
            return dt.time().second();
        }

        // Math
        double x = 0.0;
        if (!toDouble(v[0], &x)) return setError(QString("Cannot convert '%1' to a number").arg(toText(v[0])));

        if (name == "abs") {
            qlonglong i = 0;
            if (isIntegerType(v[0]) && toInteger(v[0], &i) && i != std::numeric_limits<qlonglong>::min()) {
                return qAbs(i);
            }
            return std::fabs(x);
        }
        if (name == "round") {
            if (v.size() > 1 && !isNullValue(v[1])) {
                qlonglong places = 0;
                if (!toInteger(v[1], &places)) return setError(QString("Cannot convert '%1' to an integer").arg(toText(v[1])));
                const double scale = std::pow(10.0, static_cast<double>(places));
                return std::round(x * scale) / scale;
            }
            return integralResult(std::round(x));
        }
        if (name == "floor") return integralResult(std::floor(x));
        if (name == "ceil") return integralResult(std::ceil(x));
        if (name == "sqrt") {
            if (x < 0.0) return QVariant();
            return std::sqrt(x);
        }
        if (name == "sin") return std::sin(x);
        if (name == "cos") return std::cos(x);
        if (name == "tan") return std::tan(x);
        if (name == "exp") return std::exp(x);
        if (name == "log10") {
            if (x <= 0.0) return QVariant();
            return std::log10(x);
        }
        if (name == "log") {
            if (v.size() > 1) {
                // log(base, value)
                double value = 0.0;
                if (!toDouble(v[1], &value)) return setError(QString("Cannot convert '%1' to a number").arg(toText(v[1])));
                if (x <= 0.0 || x == 1.0 || value <= 0.0) return QVariant();
                return std::log(value) / std::log(x);
            }
            if (x <= 0.0) return QVariant();
            return std::log(x);
        }
        if (name == "pow") {
            double y = 0.0;
            if (!toDouble(v[1], &y)) return setError(QString("Cannot convert '%1' to a number").arg(toText(v[1])));
            return std::pow(x, y);
        }

        return setError(QString("Function '%1' is not implemented").arg(name));
    }

    const ExpressionContext& m_context;
    QString m_error;
};

void collectColumns(const NodePtr& node, QStringList& out)
{
    if (!node) return;
    if (node->kind == Node::Column && !out.contains(node->name, Qt::CaseInsensitive)) {
        out << node->name;
    }
    for (const auto& child : node->args) collectColumns(child, out);
}

} // namespace

FeatureExpression::FeatureExpression(const QString& expression)
    : m_expression(expression)
{
    if (expression.trimmed().isEmpty()) {
        m_parserError = "Expression is empty";
        return;
    }

    QVector<Token> tokens;
    Tokenizer tokenizer(expression);
    if (!tokenizer.tokenize(tokens, m_parserError)) return;

    Parser parser(tokens);
    m_root = parser.parse(m_parserError);
}

FeatureExpression::~FeatureExpression() = default;

QVariant FeatureExpression::evaluate(const ExpressionContext& context)
{
    m_evalError.clear();
    if (hasParserError()) {
        m_evalError = m_parserError;
        return QVariant();
    }

    Evaluator evaluator(context);
    QVariant result = evaluator.eval(m_root);
    m_evalError = evaluator.error();
    return m_evalError.isEmpty() ? result : QVariant();
}

QStringList FeatureExpression::referencedColumns() const
{
    QStringList out;
    collectColumns(m_root, out);
    return out;
}

QString FeatureExpression::quotedColumnRef(const QString& name)
{
    QString escaped = name;
    escaped.replace("\"", "\"\"");
    return QString("\"%1\"").arg(escaped);
}

QString FeatureExpression::quotedString(const QString& value)
{
    QString escaped = value;
    escaped.replace("\\", "\\\\");
    escaped.replace("'", "''");
    return QString("'%1'").arg(escaped);
}

bool FeatureExpression::isTruthy(const QVariant& value)
{
    return toTriBool(value) == 1;
}

