#pragma once
#include "SQLiteCpp/SQLiteCpp.h"
#include "sqlite_fwd.hpp"
#include <cstring>
#include <stdexcept>

namespace sqlite {

inline std::vector<uint8_t> Column::get_vector() const
{
    std::vector<uint8_t> res(getBytes());
    if (res.size() > 0)
        memcpy(res.data(), getBlob(), res.size());
    return res;
}

inline Statement& Row::statement() const
{
    return st.get();
}
inline Column Row::operator[](int index) const
{
    value_assert();
    return statement().getColumn(index);
}

template <typename T>
inline T Row::get(int index) const
{
    return operator[](index);
}

inline std::vector<uint8_t> Row::get_vector(int index) const
{
    value_assert();
    return statement().getColumn(index);
}

inline auto Row::process(auto lambda) const
{
    using ret_t = std::remove_cvref_t<decltype(lambda(*this))>;
    std::optional<ret_t> r;
    if (has_value())
        r = lambda(*this);
    return r;
}

inline void Row::value_assert() const
{
    if (!hasValue) {
        throw std::runtime_error(
            "Database error: trying to access empty result.");
    }
}
inline Row::Row(Statement& st)
    : st(st)
{
    hasValue = statement().executeStep();
}

inline Column Statement::getColumn(const int aIndex)
{
    return { SQLite::Statement::getColumn(aIndex) };
}

inline void Statement::bind(const int index, std::span<const uint8_t> s)
{
    SQLite::Statement::bind(index, s.data(), int(s.size()));
}

inline void Statement::bind(const int index, int64_t i)
{
    SQLite::Statement::bind(index, i);
}

template <size_t i>
void Statement::recursive_bind()
{
}
template <size_t i, typename T, typename... Types>
void Statement::recursive_bind(T&& t, Types&&... types)
{
    bind(i, std::forward<T>(t));
    recursive_bind<i + 1>(std::forward<Types>(types)...);
}
template <typename... Types>
inline uint32_t Statement::run(Types&&... types)
{
    recursive_bind<1>(std::forward<Types>(types)...);
    auto nchanged = exec();
    reset();
    assert(nchanged >= 0);
    return nchanged;
}
}
