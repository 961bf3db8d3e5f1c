#include "event_log.hpp"

#include "picosha2.h"

#include <utility>

namespace lf {

const EventEntry& EventLog::append(Timestamp at, const std::string& kind, const EventFields& fields) {
    EventEntry entry;
    entry.sequence = entries_.size();
    entry.at = at;
    entry.kind = kind;
    entry.payload = fields.str();

    std::ostringstream leaf;
    leaf << entry.sequence << '@' << entry.at << '|' << entry.kind << ':' << entry.payload;
    entry.leafHash = hash(leaf.str());

    entries_.push_back(std::move(entry));
    return entries_.back();
}

std::vector<EventEntry> EventLog::entriesOfKind(const std::string& kind) const {
    std::vector<EventEntry> out;
    for (const auto& entry : entries_) {
        if (entry.kind == kind) {
            out.push_back(entry);
        }
    }
    return out;
}

std::string EventLog::hash(const std::string& data) {
    std::vector<unsigned char> digest(picosha2::k_digest_size);
    picosha2::hash256(data.begin(), data.end(), digest.begin(), digest.end());
    return picosha2::bytes_to_hex_string(digest.begin(), digest.end());
}

std::string EventLog::hashPair(const std::string& left, const std::string& right) {
    return hash(left + right);
}

std::vector<std::string> EventLog::leafHashes() const {
    std::vector<std::string> leaves;
    leaves.reserve(entries_.size());
    for (const auto& entry : entries_) {
        leaves.push_back(entry.leafHash);
    }
    return leaves;
}

std::string EventLog::merkleRoot() const {
    if (entries_.empty()) {
        return {};
    }

    std::vector<std::string> layer = leafHashes();
    while (layer.size() > 1) {
        std::vector<std::string> next;
        next.reserve((layer.size() + 1) / 2);
        for (std::size_t i = 0; i < layer.size(); i += 2) {
            const std::string& right = (i + 1 < layer.size()) ? layer[i + 1] : layer[i];
            next.push_back(hashPair(layer[i], right));
        }
        layer = std::move(next);
    }
    return layer.front();
}

std::vector<std::string> EventLog::merkleProof(std::size_t leafIndex) const {
    std::vector<std::string> proof;
    if (leafIndex >= entries_.size()) {
        return proof;
    }

    std::vector<std::string> layer = leafHashes();
    std::size_t index = leafIndex;
    while (layer.size() > 1) {
        std::vector<std::string> next;
        next.reserve((layer.size() + 1) / 2);
        for (std::size_t i = 0; i < layer.size(); i += 2) {
            const std::string& left = layer[i];
            const std::string& right = (i + 1 < layer.size()) ? layer[i + 1] : layer[i];
            if (i == index || i + 1 == index) {
                proof.push_back(i == index ? right : left);
            }
            next.push_back(hashPair(left, right));
        }
        index /= 2;
        layer = std::move(next);
    }
    return proof;
}

bool EventLog::verifyProof(const std::string& leafHash,
                           std::size_t leafIndex,
                           const std::vector<std::string>& proof,
                           const std::string& root) {
    std::string current = leafHash;
    std::size_t index = leafIndex;
    for (const auto& sibling : proof) {
        current = (index % 2 == 0) ? hashPair(current, sibling) : hashPair(sibling, current);
        index /= 2;
    }
    return !root.empty() && current == root;
}

} // namespace lf
