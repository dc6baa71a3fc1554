#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace rowpool::codec {

enum class DatumKind : std::uint8_t {
    Null = 0,
    Int64,
    Uint64,
    Float64,
    String,
    Bytes,
    Timestamp
};

// Microseconds since the Unix epoch, expressed in whatever time zone the owner states.
struct Timestamp final {
    std::int64_t micros = 0;

    friend bool operator==(const Timestamp&, const Timestamp&) = default;
};

// Fixed-offset session time zone used to normalise timestamps to UTC.
struct TimeZone final {
    std::chrono::seconds utc_offset{0};

    static TimeZone utc() noexcept
    {
        return TimeZone{};
    }
};

class Datum final {
public:
    Datum() = default;

    static Datum null();
    static Datum from_int64(std::int64_t value);
    static Datum from_uint64(std::uint64_t value);
    static Datum from_float64(double value);
    static Datum from_string(std::string value);
    static Datum from_bytes(std::vector<std::byte> value);
    static Datum from_timestamp(Timestamp value);

    [[nodiscard]] DatumKind kind() const noexcept;
    [[nodiscard]] bool is_null() const noexcept;

    [[nodiscard]] std::int64_t as_int64() const;
    [[nodiscard]] std::uint64_t as_uint64() const;
    [[nodiscard]] double as_float64() const;
    [[nodiscard]] const std::string& as_string() const;
    [[nodiscard]] const std::vector<std::byte>& as_bytes() const;
    [[nodiscard]] Timestamp as_timestamp() const;

    friend bool operator==(const Datum&, const Datum&) = default;

private:
    using Storage = std::variant<std::monostate,
                                 std::int64_t,
                                 std::uint64_t,
                                 double,
                                 std::string,
                                 std::vector<std::byte>,
                                 Timestamp>;

    explicit Datum(Storage value);

    Storage value_{};
};

struct ColumnValue final {
    std::int64_t column_id = 0;
    Datum value{};

    friend bool operator==(const ColumnValue&, const ColumnValue&) = default;
};

[[nodiscard]] std::string_view datum_kind_name(DatumKind kind) noexcept;
[[nodiscard]] std::string format_datum(const Datum& datum);

}  // namespace rowpool::codec
