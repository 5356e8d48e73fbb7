#include "Bencode.h"

namespace STC::Core::Descriptor
{
namespace
{
bool isAllDigits(const QByteArray &bytes)
{
    if (bytes.isEmpty()) {
        return false;
    }
    for (const char c : bytes) {
        if (c < '0' || c > '9') {
            return false;
        }
    }
    return true;
}
} // namespace

const BencodeValue *BencodeValue::find(const QByteArray &key) const
{
    if (type != Type::Dictionary) {
        return nullptr;
    }

    for (size_t i = 0; i < keys.size(); ++i) {
        if (keys[i] == key) {
            return &values[i];
        }
    }

    return nullptr;
}

BencodeParser::BencodeParser(const QByteArray &data)
    : m_data(data)
{
}

bool BencodeParser::parse(const QByteArray &data, BencodeValue &outValue, QString *errorString)
{
    BencodeParser parser(data);
    BencodeValue value;

    bool ok = parser.parseValue(value, 0);
    if (ok && parser.m_pos != data.size()) {
        ok = parser.fail(QStringLiteral("Trailing data after document"));
    }

    if (!ok) {
        if (errorString) {
            *errorString = parser.m_error;
        }
        return false;
    }

    outValue = std::move(value);
    return true;
}

bool BencodeParser::fail(const QString &message)
{
    if (m_error.isEmpty()) {
        m_error = QStringLiteral("%1 at offset %2").arg(message).arg(m_pos);
    }
    return false;
}

bool BencodeParser::parseValue(BencodeValue &out, int depth)
{
    if (depth > kMaxDepth) {
        return fail(QStringLiteral("Nesting too deep"));
    }
    if (m_pos >= m_data.size()) {
        return fail(QStringLiteral("Unexpected end of data"));
    }

    out.rawBegin = m_pos;
    const char c = m_data.at(m_pos);
    bool ok = false;

    if (c == 'i') {
        ok = parseInteger(out);
    } else if (c == 'l') {
        ok = parseList(out, depth);
    } else if (c == 'd') {
        ok = parseDictionary(out, depth);
    } else if (c >= '0' && c <= '9') {
        out.type = BencodeValue::Type::String;
        ok = parseString(out.string);
    } else {
        return fail(QStringLiteral("Unexpected byte '%1'").arg(QLatin1Char(c)));
    }

    out.rawEnd = m_pos;
    return ok;
}

bool BencodeParser::parseInteger(BencodeValue &out)
{
    ++m_pos;
    const int end = m_data.indexOf('e', m_pos);
    if (end < 0) {
        return fail(QStringLiteral("Unterminated integer"));
    }

    const QByteArray digits = m_data.mid(m_pos, end - m_pos);
    const QByteArray magnitude = digits.startsWith('-') ? digits.mid(1) : digits;
    if (!isAllDigits(magnitude) || digits == "-0" || (magnitude.size() > 1 && magnitude.startsWith('0'))) {
        return fail(QStringLiteral("Invalid integer"));
    }

    bool ok = false;
    out.integer = digits.toLongLong(&ok);
    if (!ok) {
        return fail(QStringLiteral("Invalid integer"));
    }

    out.type = BencodeValue::Type::Integer;
    m_pos = end + 1;
    return true;
}

bool BencodeParser::parseString(QByteArray &out)
{
    const int colon = m_data.indexOf(':', m_pos);
    if (colon < 0) {
        return fail(QStringLiteral("Unterminated string length"));
    }

    const QByteArray lengthDigits = m_data.mid(m_pos, colon - m_pos);
    if (!isAllDigits(lengthDigits)) {
        return fail(QStringLiteral("Invalid string length"));
    }

    bool ok = false;
    const qint64 length = lengthDigits.toLongLong(&ok);
    if (!ok || (lengthDigits.size() > 1 && lengthDigits.startsWith('0'))) {
        return fail(QStringLiteral("Invalid string length"));
    }
    if (length > m_data.size() - colon - 1) {
        return fail(QStringLiteral("String exceeds document"));
    }

    out = m_data.mid(colon + 1, int(length));
    m_pos = colon + 1 + int(length);
    return true;
}

bool BencodeParser::parseList(BencodeValue &out, int depth)
{
    out.type = BencodeValue::Type::List;
    ++m_pos;

    while (m_pos < m_data.size() && m_data.at(m_pos) != 'e') {
        BencodeValue item;
        if (!parseValue(item, depth + 1)) {
            return false;
        }
        out.list.push_back(std::move(item));
    }

    if (m_pos >= m_data.size()) {
        return fail(QStringLiteral("Unterminated list"));
    }

    ++m_pos;
    return true;
}

bool BencodeParser::parseDictionary(BencodeValue &out, int depth)
{
    out.type = BencodeValue::Type::Dictionary;
    ++m_pos;

    while (m_pos < m_data.size() && m_data.at(m_pos) != 'e') {
        const char c = m_data.at(m_pos);
        if (c < '0' || c > '9') {
            return fail(QStringLiteral("Dictionary key must be a string"));
        }

        QByteArray key;
        if (!parseString(key)) {
            return false;
        }

        BencodeValue value;
        if (!parseValue(value, depth + 1)) {
            return false;
        }

        out.keys.push_back(key);
        out.values.push_back(std::move(value));
    }

    if (m_pos >= m_data.size()) {
        return fail(QStringLiteral("Unterminated dictionary"));
    }

    ++m_pos;
    return true;
}
} // namespace STC::Core::Descriptor
