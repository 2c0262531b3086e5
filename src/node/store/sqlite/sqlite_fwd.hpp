#pragma once
#include "SQLiteCpp/Column.h"
#include "SQLiteCpp/Statement.h"
#include <cassert>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <vector>

namespace sqlite {
struct Column : public SQLite::Column {
    std::vector<uint8_t> get_vector() const;
    operator std::vector<uint8_t>() const { return get_vector(); }
    operator int64_t() const { return getInt64(); }
};

class Statement;
class Row {

private: // data
    std::reference_wrapper<Statement> st;
    bool hasValue;

public:
    friend class Statement;
    Column operator[](int index) const;
    template <typename T>
    T get(int index) const;
    std::vector<uint8_t> get_vector(int index) const;
    bool has_value() const { return hasValue; }
    auto process(auto lambda) const;

private:
    void value_assert() const;
    Row(Statement& st);
    Statement& statement() const;
};

class Statement : public SQLite::Statement {
public:
    using SQLite::Statement::Statement;
    Column getColumn(const int aIndex);
    void bind(const int index, std::span<const uint8_t> s);
    void bind(const int index, int64_t i);
    template <size_t i>
    void recursive_bind();
    template <size_t i, typename T, typename... Types>
    void recursive_bind(T&& t, Types&&... types);
    template <typename... Types>
    uint32_t run(Types&&... types);

    struct SingleResult : public Row {
        using Row::Row;
        ~SingleResult()
        {
            if (hasValue)
                assert(statement().executeStep() == false);
            statement().reset();
        }
    };

    template <typename... Types>
    [[nodiscard]] SingleResult one(Types&&... types)
    {
        recursive_bind<1>(std::forward<Types>(types)...);
        return SingleResult { *this };
    }
};

}
