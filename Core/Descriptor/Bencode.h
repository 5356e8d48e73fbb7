#pragma once

#include <QByteArray>
#include <QString>

#include <vector>

namespace STC::Core::Descriptor
{
class BencodeValue
{
public:
    enum class Type
    {
        Integer,
        String,
        List,
        Dictionary
    };

    Type type = Type::String;
    qint64 integer = 0;
    QByteArray string;
    std::vector<BencodeValue> list;

    // Dictionary entries in document order; keys[i] maps to values[i].
    std::vector<QByteArray> keys;
    std::vector<BencodeValue> values;

    // Byte span [rawBegin, rawEnd) of this value inside the parsed document.
    int rawBegin = 0;
    int rawEnd = 0;

    bool isInteger() const { return type == Type::Integer; }
    bool isString() const { return type == Type::String; }
    bool isList() const { return type == Type::List; }
    bool isDictionary() const { return type == Type::Dictionary; }

    const BencodeValue *find(const QByteArray &key) const;
};

class BencodeParser
{
public:
    static constexpr int kMaxDepth = 64;

    // Parses a complete document; trailing bytes are an error.
    static bool parse(const QByteArray &data, BencodeValue &outValue, QString *errorString = nullptr);

private:
    explicit BencodeParser(const QByteArray &data);

    bool parseValue(BencodeValue &out, int depth);
    bool parseInteger(BencodeValue &out);
    bool parseString(QByteArray &out);
    bool parseList(BencodeValue &out, int depth);
    bool parseDictionary(BencodeValue &out, int depth);
    bool fail(const QString &message);

    const QByteArray &m_data;
    int m_pos = 0;
    QString m_error;
};
} // namespace STC::Core::Descriptor
