#include "plan.hpp"
#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace nestegg {

BirthDate BirthDate::parse(const std::string& text) {
    // YYYY-MM-DD, digits only apart from the two dashes
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        throw std::invalid_argument("Invalid date (expected YYYY-MM-DD): '" + text + "'");
    }
    for (size_t i = 0; i < text.size(); ++i) {
        if (i == 4 || i == 7) continue;
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            throw std::invalid_argument("Invalid date (expected YYYY-MM-DD): '" + text + "'");
        }
    }

    BirthDate date;
    date.year = std::stoi(text.substr(0, 4));
    date.month = static_cast<unsigned>(std::stoi(text.substr(5, 2)));
    date.day = static_cast<unsigned>(std::stoi(text.substr(8, 2)));

    if (date.month < 1 || date.month > 12 || date.day < 1 || date.day > 31) {
        throw std::invalid_argument("Invalid date: '" + text + "'");
    }
    return date;
}

std::string BirthDate::to_string() const {
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(4) << year << "-"
        << std::setw(2) << month << "-" << std::setw(2) << day;
    return oss.str();
}

bool BirthDate::operator==(const BirthDate& other) const {
    return year == other.year && month == other.month && day == other.day;
}

const Person* Household::person(PersonSelector selector) const {
    const std::optional<Person>& p = selector == PersonSelector::Person1 ? person1 : person2;
    return p ? &(*p) : nullptr;
}

} // namespace nestegg
