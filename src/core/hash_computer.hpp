#pragma once

#include <string>
#include <memory>
#include <cstddef>
#include <core/types.hpp>
#include <core/byte_stream.hpp>
#include <core/constants.hpp>
#include <openssl/evp.h>

// Content digest strategy used for collision checks and the sidecar.
class HashComputer {
public:
    virtual ~HashComputer() = default;

    // Lowercase hex digest of everything left in the stream.
    virtual Result<std::string> compute_hash(ByteStream& stream) const = 0;

    // Tag recorded next to each digest ("md5", "sha256").
    virtual std::string algorithm_name() const = 0;
};

// Shared chunked EVP digest loop. Subclasses pick the algorithm.
class EvpHashComputer : public HashComputer {
public:
    Result<std::string> compute_hash(ByteStream& stream) const override;

protected:
    explicit EvpHashComputer(std::size_t chunk_size);
    virtual const EVP_MD* digest() const = 0;

private:
    std::size_t chunk_size_;
};

class Md5HashComputer : public EvpHashComputer {
public:
    explicit Md5HashComputer(std::size_t chunk_size = HASH_CHUNK_SIZE)
        : EvpHashComputer(chunk_size) {}
    std::string algorithm_name() const override { return "md5"; }

protected:
    const EVP_MD* digest() const override;
};

class Sha256HashComputer : public EvpHashComputer {
public:
    explicit Sha256HashComputer(std::size_t chunk_size = HASH_CHUNK_SIZE)
        : EvpHashComputer(chunk_size) {}
    std::string algorithm_name() const override { return "sha256"; }

protected:
    const EVP_MD* digest() const override;
};

// Build a computer by algorithm name. Unknown names are an error.
Result<std::unique_ptr<HashComputer>> make_hash_computer(const std::string& name,
                                                         std::size_t chunk_size = HASH_CHUNK_SIZE);
