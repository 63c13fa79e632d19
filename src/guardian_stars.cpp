/**
 * Fusion Duel Engine - Guardian Star Table Implementation
 */

#include "guardian_stars.hpp"
#include <algorithm>
#include <array>
#include <cctype>

namespace duel {

namespace {

// Indexed by GuardianStar
constexpr std::array<StarRelation, GUARDIAN_STAR_COUNT> STAR_TABLE = {{
    {GuardianStar::MOON,    GuardianStar::MERCURY},  // SUN
    {GuardianStar::VENUS,   GuardianStar::SUN},      // MOON
    {GuardianStar::MERCURY, GuardianStar::MOON},     // VENUS
    {GuardianStar::SUN,     GuardianStar::VENUS},    // MERCURY
    {GuardianStar::JUPITER, GuardianStar::NEPTUNE},  // MARS
    {GuardianStar::SATURN,  GuardianStar::MARS},     // JUPITER
    {GuardianStar::URANUS,  GuardianStar::JUPITER},  // SATURN
    {GuardianStar::PLUTO,   GuardianStar::SATURN},   // URANUS
    {GuardianStar::NEPTUNE, GuardianStar::URANUS},   // PLUTO
    {GuardianStar::MARS,    GuardianStar::PLUTO}     // NEPTUNE
}};

using StarPair = std::pair<GuardianStar, GuardianStar>;

const std::unordered_map<std::string, StarPair> ATTRIBUTE_TO_STARS = {
    {"Light",  {GuardianStar::SUN,     GuardianStar::MERCURY}},
    {"Dark",   {GuardianStar::MOON,    GuardianStar::VENUS}},
    {"Fire",   {GuardianStar::MARS,    GuardianStar::SUN}},
    {"Water",  {GuardianStar::NEPTUNE, GuardianStar::MOON}},
    {"Earth",  {GuardianStar::URANUS,  GuardianStar::JUPITER}},
    {"Wind",   {GuardianStar::SATURN,  GuardianStar::JUPITER}},
    {"Divine", {GuardianStar::SUN,     GuardianStar::MOON}}
};

const std::unordered_map<std::string, StarPair> TYPE_TO_STARS = {
    {"Dragon",        {GuardianStar::MARS,    GuardianStar::MOON}},
    {"Spellcaster",   {GuardianStar::MERCURY, GuardianStar::VENUS}},
    {"Warrior",       {GuardianStar::URANUS,  GuardianStar::SUN}},
    {"Beast",         {GuardianStar::JUPITER, GuardianStar::SATURN}},
    {"Beast-Warrior", {GuardianStar::JUPITER, GuardianStar::URANUS}},
    {"Winged-Beast",  {GuardianStar::SATURN,  GuardianStar::JUPITER}},
    {"Fiend",         {GuardianStar::MOON,    GuardianStar::VENUS}},
    {"Zombie",        {GuardianStar::MOON,    GuardianStar::PLUTO}},
    {"Machine",       {GuardianStar::PLUTO,   GuardianStar::URANUS}},
    {"Aqua",          {GuardianStar::NEPTUNE, GuardianStar::MOON}},
    {"Fish",          {GuardianStar::NEPTUNE, GuardianStar::SATURN}},
    {"Sea-Serpent",   {GuardianStar::NEPTUNE, GuardianStar::MARS}},
    {"Reptile",       {GuardianStar::URANUS,  GuardianStar::NEPTUNE}},
    {"Pyro",          {GuardianStar::MARS,    GuardianStar::SUN}},
    {"Thunder",       {GuardianStar::PLUTO,   GuardianStar::SATURN}},
    {"Rock",          {GuardianStar::URANUS,  GuardianStar::MARS}},
    {"Plant",         {GuardianStar::JUPITER, GuardianStar::SUN}},
    {"Insect",        {GuardianStar::JUPITER, GuardianStar::MOON}},
    {"Fairy",         {GuardianStar::SUN,     GuardianStar::VENUS}},
    {"Dinosaur",      {GuardianStar::URANUS,  GuardianStar::MARS}}
};

// Used when attribute or type is missing from the tables
constexpr StarPair DEFAULT_ATTRIBUTE_STARS = {GuardianStar::URANUS, GuardianStar::JUPITER};
constexpr GuardianStar DEFAULT_TYPE_STAR = GuardianStar::JUPITER;

} // namespace

StarRelation star_relation(GuardianStar star) {
    return STAR_TABLE[static_cast<size_t>(star)];
}

int combat_bonus(GuardianStar attacker_star, GuardianStar defender_star) {
    const StarRelation& rel = star_relation(attacker_star);
    if (rel.strong == defender_star) {
        return STAR_BONUS;
    }
    if (rel.weak == defender_star) {
        return -STAR_BONUS;
    }
    return 0;
}

std::pair<GuardianStar, GuardianStar> assign_guardian_stars(const std::string& attribute,
                                                            const std::string& card_type) {
    StarPair attr_stars = DEFAULT_ATTRIBUTE_STARS;
    auto attr_it = ATTRIBUTE_TO_STARS.find(attribute);
    if (attr_it != ATTRIBUTE_TO_STARS.end()) {
        attr_stars = attr_it->second;
    }

    GuardianStar star1 = attr_stars.first;
    GuardianStar star2 = DEFAULT_TYPE_STAR;

    auto type_it = TYPE_TO_STARS.find(card_type);
    if (type_it != TYPE_TO_STARS.end()) {
        star2 = type_it->second.second;
    }

    if (star1 == star2) {
        star2 = attr_stars.second;
    }

    return {star1, star2};
}

std::optional<GuardianStar> parse_guardian_star(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (int i = 0; i < GUARDIAN_STAR_COUNT; ++i) {
        auto star = static_cast<GuardianStar>(i);
        std::string star_name = to_string(star);
        std::transform(star_name.begin(), star_name.end(), star_name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (star_name == lower) {
            return star;
        }
    }
    return std::nullopt;
}

} // namespace duel
