#include "rowpool/codec/datum.hpp"

#include <iomanip>
#include <sstream>
#include <utility>

namespace rowpool::codec {

Datum::Datum(Storage value)
    : value_{std::move(value)}
{}

Datum Datum::null()
{
    return Datum{};
}

Datum Datum::from_int64(std::int64_t value)
{
    return Datum{Storage{std::in_place_type<std::int64_t>, value}};
}

Datum Datum::from_uint64(std::uint64_t value)
{
    return Datum{Storage{std::in_place_type<std::uint64_t>, value}};
}

Datum Datum::from_float64(double value)
{
    return Datum{Storage{std::in_place_type<double>, value}};
}

Datum Datum::from_string(std::string value)
{
    return Datum{Storage{std::in_place_type<std::string>, std::move(value)}};
}

Datum Datum::from_bytes(std::vector<std::byte> value)
{
    return Datum{Storage{std::in_place_type<std::vector<std::byte>>, std::move(value)}};
}

Datum Datum::from_timestamp(Timestamp value)
{
    return Datum{Storage{std::in_place_type<Timestamp>, value}};
}

DatumKind Datum::kind() const noexcept
{
    return static_cast<DatumKind>(value_.index());
}

bool Datum::is_null() const noexcept
{
    return std::holds_alternative<std::monostate>(value_);
}

std::int64_t Datum::as_int64() const
{
    return std::get<std::int64_t>(value_);
}

std::uint64_t Datum::as_uint64() const
{
    return std::get<std::uint64_t>(value_);
}

double Datum::as_float64() const
{
    return std::get<double>(value_);
}

const std::string& Datum::as_string() const
{
    return std::get<std::string>(value_);
}

const std::vector<std::byte>& Datum::as_bytes() const
{
    return std::get<std::vector<std::byte>>(value_);
}

Timestamp Datum::as_timestamp() const
{
    return std::get<Timestamp>(value_);
}

std::string_view datum_kind_name(DatumKind kind) noexcept
{
    switch (kind) {
    case DatumKind::Null:
        return "null";
    case DatumKind::Int64:
        return "int64";
    case DatumKind::Uint64:
        return "uint64";
    case DatumKind::Float64:
        return "float64";
    case DatumKind::String:
        return "string";
    case DatumKind::Bytes:
        return "bytes";
    case DatumKind::Timestamp:
        return "timestamp";
    default:
        return "unknown";
    }
}

std::string format_datum(const Datum& datum)
{
    std::ostringstream stream;
    switch (datum.kind()) {
    case DatumKind::Null:
        stream << "NULL";
        break;
    case DatumKind::Int64:
        stream << datum.as_int64();
        break;
    case DatumKind::Uint64:
        stream << datum.as_uint64();
        break;
    case DatumKind::Float64:
        stream << datum.as_float64();
        break;
    case DatumKind::String:
        stream << std::quoted(datum.as_string());
        break;
    case DatumKind::Bytes:
        stream << "0x" << std::hex << std::setfill('0');
        for (const auto byte : datum.as_bytes()) {
            stream << std::setw(2) << std::to_integer<unsigned>(byte);
        }
        break;
    case DatumKind::Timestamp:
        stream << "ts:" << datum.as_timestamp().micros;
        break;
    default:
        stream << "?";
        break;
    }
    return stream.str();
}

}  // namespace rowpool::codec
