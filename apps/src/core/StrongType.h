#pragma once

#include <functional>
#include <nlohmann/json.hpp>
#include <ostream>
#include <spdlog/fmt/fmt.h>

namespace CampusSim {

// Strong integer id wrapper. Distinct tags give distinct, non-mixable id types.
//
// Usage:
//   using EventId = StrongType<struct EventIdTag>;
//   using BookingId = StrongType<struct BookingIdTag>;
//
//   EventId event{ 3 };
//   BookingId booking{ 3 };
//   // event == booking;  // Compile error - different types.
//   int raw = event.get(); // Explicit access to underlying value.
template <typename Tag>
class StrongType {
public:
    constexpr StrongType() : m_value{ 0 } {}
    constexpr explicit StrongType(int value) : m_value{ value } {}

    [[nodiscard]] constexpr int get() const { return m_value; }

    constexpr bool operator==(const StrongType& other) const { return m_value == other.m_value; }
    constexpr bool operator!=(const StrongType& other) const { return m_value != other.m_value; }
    constexpr bool operator<(const StrongType& other) const { return m_value < other.m_value; }
    constexpr bool operator<=(const StrongType& other) const { return m_value <= other.m_value; }
    constexpr bool operator>(const StrongType& other) const { return m_value > other.m_value; }
    constexpr bool operator>=(const StrongType& other) const { return m_value >= other.m_value; }

    // Increment operators (for sequential id allocation).
    StrongType& operator++()
    {
        ++m_value;
        return *this;
    }
    StrongType operator++(int)
    {
        StrongType temp = *this;
        ++m_value;
        return temp;
    }

private:
    int m_value;
};

template <typename Tag>
void to_json(nlohmann::json& j, const StrongType<Tag>& st)
{
    j = st.get();
}

template <typename Tag>
void from_json(const nlohmann::json& j, StrongType<Tag>& st)
{
    st = StrongType<Tag>{ j.get<int>() };
}

template <typename Tag>
std::ostream& operator<<(std::ostream& os, const StrongType<Tag>& st)
{
    return os << st.get();
}

} // namespace CampusSim

template <typename Tag>
struct std::hash<CampusSim::StrongType<Tag>> {
    std::size_t operator()(const CampusSim::StrongType<Tag>& st) const noexcept
    {
        return std::hash<int>{}(st.get());
    }
};

// fmt formatting support for spdlog.
template <typename Tag>
struct fmt::formatter<CampusSim::StrongType<Tag>> : fmt::formatter<int> {
    auto format(const CampusSim::StrongType<Tag>& st, fmt::format_context& ctx) const
    {
        return fmt::formatter<int>::format(st.get(), ctx);
    }
};
