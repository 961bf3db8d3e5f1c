#pragma once

#include "clock.hpp"

#include <cstddef>
#include <cstdint>
#include <sstream>
#include <string>
#include <vector>

namespace lf {

struct EventEntry {
    std::uint64_t sequence = 0;
    Timestamp at = 0;
    std::string kind;
    std::string payload;
    std::string leafHash;
};

// Builds the canonical "key=value;key=value" payload of an event.
class EventFields {
public:
    template <typename T>
    EventFields& add(const std::string& key, const T& value) {
        if (!first_) {
            out_ << ';';
        }
        first_ = false;
        out_ << key << '=' << value;
        return *this;
    }

    std::string str() const { return out_.str(); }

private:
    std::ostringstream out_;
    bool first_ = true;
};

// Append-only audit log of committed state changes. Each entry is hashed
// into a leaf; the Merkle root commits to the whole ordered history.
class EventLog {
public:
    const EventEntry& append(Timestamp at, const std::string& kind, const EventFields& fields);

    const std::vector<EventEntry>& entries() const { return entries_; }
    std::vector<EventEntry> entriesOfKind(const std::string& kind) const;
    std::size_t size() const { return entries_.size(); }

    std::string merkleRoot() const;
    std::vector<std::string> merkleProof(std::size_t leafIndex) const;
    static bool verifyProof(const std::string& leafHash,
                            std::size_t leafIndex,
                            const std::vector<std::string>& proof,
                            const std::string& root);

    static std::string hash(const std::string& data);

private:
    static std::string hashPair(const std::string& left, const std::string& right);
    std::vector<std::string> leafHashes() const;

    std::vector<EventEntry> entries_;
};

} // namespace lf
