#include "transition.hpp"
#include "errors.hpp"

namespace nestegg {

namespace {

Decimal inflate(const Decimal& amount, bool apply_inflation, const Decimal& inflation_rate,
                int years_since_anchor) {
    if (!apply_inflation) {
        return round_cents(amount);
    }
    return compound(amount, inflation_rate, years_since_anchor);
}

void sum_totals(Balances& balances, const EntityCollections& entities) {
    Decimal nest_egg = balances.nest_egg_cash;
    Decimal net_worth = balances.nest_egg_cash + balances.other_cash;

    for (const Asset& asset : entities.assets) {
        const Decimal& value = balances.assets.at(asset.asset_id);
        net_worth += value;
        if (asset.include_in_nest_egg) {
            nest_egg += value;
        }
    }

    for (const Liability& liability : entities.liabilities) {
        const Decimal& value = balances.liabilities.at(liability.liability_id);
        net_worth -= value;
        if (liability.include_in_nest_egg) {
            nest_egg -= value;
        }
    }

    balances.nest_egg_total = round_cents(nest_egg);
    balances.net_worth_total = round_cents(net_worth);
}

} // anonymous namespace

bool YearRange::contains(int year) const {
    return start_year <= year && (!end_year || year <= *end_year);
}

// ============================================================================
// Per-run preparation
// ============================================================================

ProjectionAssumptions prepare_assumptions(const EffectiveEntitySet& set,
                                          const ProjectionWindow& window,
                                          const TimeResolver& time) {
    const EffectiveAssumptions& effective = set.assumptions;
    if (effective.annual_retirement_spending < 0) {
        throw IncompleteEntity(set.label, "annual_retirement_spending", "negative spending");
    }

    ProjectionAssumptions prepared;
    prepared.default_growth_rate = effective.default_growth_rate;
    prepared.inflation_rate = effective.inflation_rate;
    prepared.annual_retirement_spending = effective.annual_retirement_spending;
    prepared.retirement_year = window.retirement_year;

    for (const RetirementIncomeStream& income : set.entities.income_streams) {
        const std::string entity = describe_entity("income", income.income_id);
        const bool owner_known =
            income.owner == Owner::Person1 ? time.has_person(PersonSelector::Person1) :
            income.owner == Owner::Person2 ? time.has_person(PersonSelector::Person2) :
            time.has_person(time.reference_person());
        if (!owner_known) {
            throw IncompleteEntity(entity, "owner",
                                   owner_to_string(income.owner) + " has no birth date");
        }

        YearRange range;
        range.start_year = time.year_for_owner_age(income.owner, income.start_age);
        if (income.end_age) {
            range.end_year = time.year_for_owner_age(income.owner, *income.end_age);
        }
        prepared.income_years[income.income_id] = range;
    }

    return prepared;
}

// ============================================================================
// Balances
// ============================================================================

Balances Balances::seed(const EntityCollections& entities) {
    Balances balances;
    balances.nest_egg_cash = 0;
    balances.other_cash = 0;

    for (const Asset& asset : entities.assets) {
        balances.assets[asset.asset_id] = round_cents(asset.value);
    }
    for (const Liability& liability : entities.liabilities) {
        balances.liabilities[liability.liability_id] = round_cents(liability.value);
    }

    sum_totals(balances, entities);
    return balances;
}

Decimal grown_income(const RetirementIncomeStream& income, int start_year, int year,
                     const Decimal& default_growth_rate) {
    Decimal amount = round_cents(income.annual_income);
    if (!income.growth) {
        return amount;
    }
    for (int y = start_year + 1; y <= year; ++y) {
        amount = apply_rate(amount, income.growth->effective_rate(y, default_growth_rate));
    }
    return amount;
}

// ============================================================================
// Annual transition
// ============================================================================

Balances advance(const Balances& prior,
                 const EntityCollections& entities,
                 int year,
                 const ProjectionAssumptions& assumptions) {
    Balances next;
    next.assets = prior.assets;
    next.liabilities = prior.liabilities;
    next.nest_egg_cash = prior.nest_egg_cash;
    next.other_cash = prior.other_cash;

    YearActivity& activity = next.activity;
    activity.inflows = 0;
    activity.outflows = 0;
    activity.retirement_income = 0;
    activity.retirement_spending = 0;
    activity.growth = 0;
    activity.liability_interest = 0;

    // Step 1: scheduled inflows
    for (const ScheduledFlow& flow : entities.flows) {
        if (flow.type != FlowType::Inflow || !flow.is_active(year)) continue;
        const Decimal amount = inflate(flow.annual_amount, flow.apply_inflation,
                                       assumptions.inflation_rate, year - flow.start_year);
        next.nest_egg_cash += amount;
        activity.inflows += amount;
    }

    // Step 2: scheduled outflows
    for (const ScheduledFlow& flow : entities.flows) {
        if (flow.type != FlowType::Outflow || !flow.is_active(year)) continue;
        const Decimal amount = inflate(flow.annual_amount, flow.apply_inflation,
                                       assumptions.inflation_rate, year - flow.start_year);
        next.nest_egg_cash -= amount;
        activity.outflows += amount;
    }

    // Step 3: retirement income
    for (const RetirementIncomeStream& income : entities.income_streams) {
        auto range = assumptions.income_years.find(income.income_id);
        if (range == assumptions.income_years.end()) {
            throw IncompleteEntity(describe_entity("income", income.income_id), "start_age",
                                   "age gate was not resolved for this run");
        }
        if (!range->second.contains(year)) continue;

        const int start_year = range->second.start_year;
        const Decimal base = grown_income(income, start_year, year, assumptions.default_growth_rate);
        const Decimal amount = inflate(base, income.apply_inflation,
                                       assumptions.inflation_rate, year - start_year);
        if (income.include_in_nest_egg) {
            next.nest_egg_cash += amount;
        } else {
            next.other_cash += amount;
        }
        activity.retirement_income += amount;
    }

    // Step 4: retirement spending
    if (year >= assumptions.retirement_year && assumptions.annual_retirement_spending != 0) {
        const Decimal amount = compound(assumptions.annual_retirement_spending,
                                        assumptions.inflation_rate,
                                        year - assumptions.retirement_year);
        next.nest_egg_cash -= amount;
        activity.retirement_spending = amount;
    }

    // Step 5: growth on post-step-4 balances
    for (const Asset& asset : entities.assets) {
        Decimal& balance = next.assets.at(asset.asset_id);
        const Decimal grown = apply_rate(balance, asset.growth.effective_rate(year, assumptions.default_growth_rate));
        activity.growth += grown - balance;
        balance = grown;
    }
    for (Decimal* pool : {&next.nest_egg_cash, &next.other_cash}) {
        const Decimal grown = apply_rate(*pool, assumptions.default_growth_rate);
        activity.growth += grown - *pool;
        *pool = grown;
    }

    // Step 6: liability interest
    for (const Liability& liability : entities.liabilities) {
        if (!liability.interest_rate) continue;
        Decimal& balance = next.liabilities.at(liability.liability_id);
        const Decimal accrued = apply_rate(balance, *liability.interest_rate);
        activity.liability_interest += accrued - balance;
        balance = accrued;
    }

    // Step 7: totals
    sum_totals(next, entities);
    return next;
}

} // namespace nestegg
