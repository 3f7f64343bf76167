#include "transform/pseudonym_generator.hpp"
#include "core/utils.hpp"

#include <array>
#include <format>

namespace anonymizer {

namespace {

constexpr std::array<std::string_view, 48> kFirstNames = {
    "James", "Mary", "Robert", "Patricia", "John", "Jennifer", "Michael", "Linda",
    "David", "Elizabeth", "William", "Barbara", "Richard", "Susan", "Joseph", "Jessica",
    "Thomas", "Sarah", "Charles", "Karen", "Daniel", "Lisa", "Matthew", "Nancy",
    "Anthony", "Sandra", "Mark", "Ashley", "Steven", "Emily", "Andrew", "Donna",
    "Joshua", "Michelle", "Kevin", "Carol", "Brian", "Amanda", "George", "Melissa",
    "Edward", "Deborah", "Ronald", "Stephanie", "Jason", "Rebecca", "Ryan", "Laura",
};

constexpr std::array<std::string_view, 48> kLastNames = {
    "Garcia", "Miller", "Davis", "Rodriguez", "Martinez", "Hernandez", "Lopez", "Gonzalez",
    "Wilson", "Anderson", "Taylor", "Moore", "Jackson", "Martin", "Lee", "Perez",
    "Thompson", "White", "Harris", "Sanchez", "Clark", "Ramirez", "Lewis", "Robinson",
    "Walker", "Young", "Allen", "King", "Wright", "Scott", "Torres", "Nguyen",
    "Hill", "Flores", "Green", "Adams", "Nelson", "Baker", "Hall", "Rivera",
    "Campbell", "Mitchell", "Carter", "Roberts", "Turner", "Phillips", "Parker", "Evans",
};

constexpr std::array<std::string_view, 4> kEmailDomains = {
    "example.com", "example.org", "example.net", "mail.example",
};

constexpr int kMaxRetries = 16;

} // anonymous namespace

PseudonymGenerator::PseudonymGenerator(uint64_t seed) : rng_(seed) {}

PseudonymGenerator::Kind PseudonymGenerator::kind_from_string(std::string_view mode) {
    if (mode == "email") return Kind::EMAIL;
    if (mode == "phone") return Kind::PHONE;
    return Kind::NAME;
}

std::string PseudonymGenerator::next(Kind kind, std::string_view avoid) {
    std::string token;
    for (int attempt = 0; attempt < kMaxRetries; ++attempt) {
        token = candidate(kind);
        if (token != avoid && !issued_.contains(token)) {
            issued_.insert(token);
            return token;
        }
    }

    // Word lists exhausted for this seed: suffix the last candidate until unique
    std::string unique;
    do {
        unique = disambiguate(kind, token, ++collisions_ + 1);
    } while (unique == avoid || issued_.contains(unique));
    issued_.insert(unique);
    return unique;
}

std::string PseudonymGenerator::candidate(Kind kind) {
    switch (kind) {
        case Kind::EMAIL: {
            // Draws are sequenced explicitly so a seed maps to one token on every compiler
            const std::string first = utils::to_lower(std::string(pick_first_name()));
            const std::string last = utils::to_lower(std::string(pick_last_name()));
            std::uniform_int_distribution<int> num_dist(1, 99);
            const int num = num_dist(rng_);
            std::uniform_int_distribution<size_t> domain_dist(0, kEmailDomains.size() - 1);
            const auto domain = kEmailDomains[domain_dist(rng_)];
            return std::format("{}.{}{}@{}", first, last, num, domain);
        }

        case Kind::PHONE: {
            // NANP-shaped: area and exchange codes never start with 0 or 1
            std::uniform_int_distribution<int> code_dist(200, 999);
            std::uniform_int_distribution<int> line_dist(0, 9999);
            const int area = code_dist(rng_);
            const int exchange = code_dist(rng_);
            const int line = line_dist(rng_);
            return std::format("({:03d}) {:03d}-{:04d}", area, exchange, line);
        }

        case Kind::NAME:
            break;
    }
    const auto first = pick_first_name();
    const auto last = pick_last_name();
    return std::format("{} {}", first, last);
}

std::string PseudonymGenerator::disambiguate(Kind kind, const std::string& base, uint64_t n) const {
    switch (kind) {
        case Kind::EMAIL: {
            const auto at = base.find('@');
            if (at != std::string::npos) {
                return std::format("{}.{}{}", base.substr(0, at), n, base.substr(at));
            }
            return std::format("{}.{}", base, n);
        }
        case Kind::PHONE:
            return std::format("{} x{}", base, n);
        case Kind::NAME:
            break;
    }
    return std::format("{} {}", base, n);
}

std::string_view PseudonymGenerator::pick_first_name() {
    std::uniform_int_distribution<size_t> dist(0, kFirstNames.size() - 1);
    return kFirstNames[dist(rng_)];
}

std::string_view PseudonymGenerator::pick_last_name() {
    std::uniform_int_distribution<size_t> dist(0, kLastNames.size() - 1);
    return kLastNames[dist(rng_)];
}

} // namespace anonymizer
