#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Read-only access to raw account bytes on chain.
class ChainDataAccessor {
public:
    virtual ~ChainDataAccessor() = default;

    // nullopt when the account does not exist; throws TransportError when
    // the chain could not be reached
    virtual std::optional<std::vector<uint8_t>> get_account_data(const std::string& address) = 0;
};
