#include "core/discovery/DnsRecord.hpp"
#include <QtEndian>

namespace rsb::dns {

namespace {

constexpr int kMaxLabelLength = 63;
constexpr int kMaxNameLength = 255;

bool readU16(const QByteArray& data, int offset, uint16_t* out)
{
    if (offset < 0 || offset + 2 > data.size())
        return false;
    *out = qFromBigEndian<uint16_t>(reinterpret_cast<const uchar*>(data.constData() + offset));
    return true;
}

bool readU32(const QByteArray& data, int offset, uint32_t* out)
{
    if (offset < 0 || offset + 4 > data.size())
        return false;
    *out = qFromBigEndian<uint32_t>(reinterpret_cast<const uchar*>(data.constData() + offset));
    return true;
}

} // namespace

std::optional<QStringList> parseName(const QByteArray& data, int offset, int* consumed)
{
    QStringList labels;
    int pos = offset;
    int wireLength = 0;

    while (true) {
        if (pos < 0 || pos >= data.size())
            return std::nullopt;

        const auto length = static_cast<uint8_t>(data.at(pos));
        ++pos;

        if (length == 0)
            break;
        // 0b11xxxxxx is a compression pointer, 0b01/0b10 are reserved
        if (length > kMaxLabelLength)
            return std::nullopt;
        if (pos + length > data.size())
            return std::nullopt;

        wireLength += length + 1;
        if (wireLength > kMaxNameLength)
            return std::nullopt;

        labels.append(QString::fromUtf8(data.constData() + pos, length));
        pos += length;
    }

    if (consumed)
        *consumed = pos - offset;
    return labels;
}

std::optional<ResourceRecord> parseResourceRecord(const QByteArray& data)
{
    int nameLength = 0;
    auto name = parseName(data, 0, &nameLength);
    if (!name)
        return std::nullopt;

    ResourceRecord rr;
    rr.name = *name;

    int pos = nameLength;
    uint16_t rdLength = 0;
    if (!readU16(data, pos, &rr.type) ||
        !readU16(data, pos + 2, &rr.klass) ||
        !readU32(data, pos + 4, &rr.ttl) ||
        !readU16(data, pos + 8, &rdLength)) {
        return std::nullopt;
    }
    pos += 10;

    if (pos + rdLength > data.size())
        return std::nullopt;

    rr.rdata = data.mid(pos, rdLength);
    return rr;
}

QString joinName(const QStringList& labels)
{
    return labels.join(QLatin1Char('.'));
}

} // namespace rsb::dns
