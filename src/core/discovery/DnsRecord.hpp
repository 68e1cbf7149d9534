#pragma once

#include <QByteArray>
#include <QString>
#include <QStringList>
#include <cstdint>
#include <optional>

namespace rsb::dns {

constexpr uint16_t kClassIN = 1;
constexpr uint16_t kTypePTR = 12;
constexpr uint16_t kTypeTXT = 16;
constexpr uint16_t kTypeSRV = 33;

/// A resource record as serialized by systemd-resolved (uncompressed wire format).
struct ResourceRecord {
    QStringList name;   // labels, root label excluded
    uint16_t type = 0;
    uint16_t klass = 0;
    uint32_t ttl = 0;
    QByteArray rdata;
};

/// Parse a sequence of length-prefixed labels ending with the root label.
/// Compression pointers are rejected: resolved never emits them per record.
/// On success `consumed` holds the number of bytes read.
std::optional<QStringList> parseName(const QByteArray& data, int offset, int* consumed = nullptr);

/// Parse one resource record starting at offset 0. Trailing bytes are ignored.
std::optional<ResourceRecord> parseResourceRecord(const QByteArray& data);

/// Join labels into dotted presentation form ("Kitchen._raop._tcp.local").
QString joinName(const QStringList& labels);

} // namespace rsb::dns
