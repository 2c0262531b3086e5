#pragma once
#include "general/serializer.hxx"
#include <string>
#include <string_view>

class Reader;

// Identity of a ledger participant as handed over by the authenticating
// host. Its content is never interpreted, only compared.
class AccountId {
public:
    explicit AccountId(std::string id)
        : id(std::move(id))
    {
    }
    AccountId(Reader& r);
    bool operator==(const AccountId&) const = default;
    auto operator<=>(const AccountId&) const = default;

    const std::string& to_string() const { return id; }
    void serialize(Serializer auto&& s) const
    {
        s << uint32_t(id.size()) << std::string_view(id);
    }

private:
    std::string id;
};
