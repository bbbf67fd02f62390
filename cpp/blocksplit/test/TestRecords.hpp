#ifndef BLOCKSPLIT_TEST_TESTRECORDS_HPP
#define BLOCKSPLIT_TEST_TESTRECORDS_HPP

#include "blocksplit/BinaryEncoding.hpp"
#include "blocksplit/Errors.hpp"
#include "blocksplit/RecordCoder.hpp"
#include "blocksplit/Schema.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <ostream>
#include <random>
#include <string>
#include <vector>

namespace blocksplit
{
namespace test
{

/**
 * A record that always encodes to 16 bytes: a one byte length followed
 * by a 15 byte array whose first four bytes hold an integer.
 */
struct FixedRecord {
    std::array<std::uint8_t, 15> value{};

    explicit FixedRecord(int i = 0)
    {
        value[0] = static_cast<std::uint8_t>(i);
        value[1] = static_cast<std::uint8_t>(i >> 8);
        value[2] = static_cast<std::uint8_t>(i >> 16);
        value[3] = static_cast<std::uint8_t>(i >> 24);
    }

    int as_int() const
    {
        return static_cast<int>(value[0] | (value[1] << 8) |
                                (value[2] << 16) |
                                (static_cast<std::uint32_t>(value[3]) << 24));
    }

    bool operator==(FixedRecord const& other) const
    {
        return as_int() == other.as_int();
    }
};

inline std::ostream& operator<<(std::ostream& os, FixedRecord const& record)
{
    return os << "FixedRecord(" << record.as_int() << ")";
}

struct Bird {
    std::int64_t number = 0;
    std::string species;
    std::string quality;
    std::int64_t quantity = 0;

    bool operator==(Bird const& other) const
    {
        return number == other.number && species == other.species &&
               quality == other.quality && quantity == other.quantity;
    }
};

inline std::ostream& operator<<(std::ostream& os, Bird const& bird)
{
    return os << "Bird(" << bird.number << " " << bird.quantity << " "
              << bird.quality << " " << bird.species << ")";
}

inline std::vector<FixedRecord> create_fixed_records(int count)
{
    std::vector<FixedRecord> records;
    for(int ii = 0; ii < count; ++ii) { records.emplace_back(ii); }
    return records;
}

inline std::vector<Bird> create_random_records(std::int64_t count)
{
    std::vector<std::string> const qualities = {"miserable",
                                                "forelorn",
                                                "fidgity",
                                                "squirrelly",
                                                "fanciful",
                                                "chipper",
                                                "lazy"};
    std::vector<std::string> const species =
        {"pigeons", "owls", "gulls", "hawks", "robins", "jays"};
    std::mt19937_64 rng(0);
    std::uniform_int_distribution<std::size_t> quality_dist(0, qualities.size() - 1);
    std::uniform_int_distribution<std::size_t> species_dist(0, species.size() - 1);
    std::uniform_int_distribution<std::int64_t> quantity_dist;

    std::vector<Bird> records;
    for(std::int64_t ii = 0; ii < count; ++ii) {
        Bird bird;
        bird.quality  = qualities[quality_dist(rng)];
        bird.species  = species[species_dist(rng)];
        bird.number   = ii;
        bird.quantity = quantity_dist(rng);
        records.push_back(bird);
    }
    return records;
}

} // namespace test

template <>
struct RecordCoder<test::FixedRecord> {
    static Schema schema()
    {
        return Schema("FixedRecord",
                      {{"value", FieldType::BYTES}},
                      "blocksplit.test");
    }

    static test::FixedRecord decode(BinaryDecoder& decoder)
    {
        Bytes bytes = decoder.read_bytes();
        test::FixedRecord record;
        if(bytes.size() != record.value.size()) {
            throw FormatError("FixedRecord holds " +
                              std::to_string(bytes.size()) + " bytes");
        }
        std::copy(bytes.begin(), bytes.end(), record.value.begin());
        return record;
    }

    static void encode(test::FixedRecord const& record, BinaryEncoder& encoder)
    {
        encoder.write_bytes(Bytes(record.value.begin(), record.value.end()));
    }
};

template <>
struct RecordCoder<test::Bird> {
    static Schema schema()
    {
        return Schema("Bird",
                      {{"number", FieldType::LONG},
                       {"species", FieldType::STRING},
                       {"quality", FieldType::STRING},
                       {"quantity", FieldType::LONG}},
                      "blocksplit.test");
    }

    static test::Bird decode(BinaryDecoder& decoder)
    {
        test::Bird bird;
        bird.number   = decoder.read_long();
        bird.species  = decoder.read_string();
        bird.quality  = decoder.read_string();
        bird.quantity = decoder.read_long();
        return bird;
    }

    static void encode(test::Bird const& bird, BinaryEncoder& encoder)
    {
        encoder.write_long(bird.number);
        encoder.write_string(bird.species);
        encoder.write_string(bird.quality);
        encoder.write_long(bird.quantity);
    }
};

} // namespace blocksplit

#endif // BLOCKSPLIT_TEST_TESTRECORDS_HPP
