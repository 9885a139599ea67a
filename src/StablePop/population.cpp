#include "population.h"
#include "StablePop.Core/exception.h"
#include "StablePop.Core/math_util.h"

#include <fmt/format.h>
#include <numeric>

namespace spop {

core::Count AgeGenderMap::count() const noexcept {
    return core::MathHelper::saturating_add(count_gender(core::Gender::male),
                                            count_gender(core::Gender::female));
}

core::Count AgeGenderMap::count_gender(core::Gender gender) const noexcept {
    const auto &data = gender == core::Gender::male ? males : females;
    return std::accumulate(data.begin(), data.end(), core::Count{0},
                           [](core::Count previous, const auto &entry) {
                               return core::MathHelper::saturating_add(previous, entry.second);
                           });
}

core::Count AgeGenderMap::count_age(int age) const noexcept {
    core::Count total{};
    if (auto it = males.find(age); it != males.end()) {
        total = core::MathHelper::saturating_add(total, it->second);
    }

    if (auto it = females.find(age); it != females.end()) {
        total = core::MathHelper::saturating_add(total, it->second);
    }

    return total;
}

core::Count AgeGenderMap::count_age_gender(int age, core::Gender gender) const {
    return gender == core::Gender::male ? males.at(age) : females.at(age);
}

double CohortData::ratio() const {
    if (females == 0) {
        throw core::NoDataError("Cohort fertility ratio with zero females.");
    }

    return static_cast<double>(births) / static_cast<double>(females);
}

void CohortFertility::add_births(int birth_year, core::Count births) {
    auto &cohort = data_[birth_year];
    cohort.births = core::MathHelper::saturating_add(cohort.births, births);
}

void CohortFertility::add_females(int birth_year, core::Count females) {
    auto &cohort = data_[birth_year];
    cohort.females = core::MathHelper::saturating_add(cohort.females, females);
}

void CohortFertility::retain(int first_year, int last_year) {
    std::erase_if(data_, [first_year, last_year](const auto &entry) {
        return entry.first < first_year || entry.first > last_year;
    });
}

double CohortFertility::avg() const {
    auto sum = 0.0;
    auto count = std::size_t{0};
    for (const auto &[year, cohort] : data_) {
        if (cohort.females > 0) {
            sum += cohort.ratio();
            count++;
        }
    }

    if (count == 0) {
        throw core::NoDataError(
            fmt::format("Cohort fertility average over {} cohorts without females.", data_.size()));
    }

    return sum / static_cast<double>(count);
}

const CohortData &CohortFertility::at(int birth_year) const { return data_.at(birth_year); }

bool CohortFertility::contains(int birth_year) const noexcept {
    return data_.contains(birth_year);
}

std::size_t CohortFertility::size() const noexcept { return data_.size(); }

bool CohortFertility::empty() const noexcept { return data_.empty(); }

CohortFertility::const_iterator CohortFertility::begin() const noexcept { return data_.begin(); }

CohortFertility::const_iterator CohortFertility::end() const noexcept { return data_.end(); }

PopulationState::PopulationState(int max_age) : max_age_{max_age} {
    if (max_age < 0) {
        throw std::invalid_argument(
            fmt::format("Population maximum age must not be negative, given: {}.", max_age));
    }

    buckets_ = core::CountArray2D(static_cast<std::size_t>(max_age) + 2, 2, core::Count{0});
}

int PopulationState::max_age() const noexcept { return max_age_; }

int PopulationState::bucket_count() const noexcept { return max_age_ + 2; }

core::Count &PopulationState::at(int age, core::Gender gender) {
    if (age < 0) {
        throw std::out_of_range(fmt::format("Negative population age: {}.", age));
    }

    return buckets_(static_cast<std::size_t>(age), core::gender_index(gender));
}

const core::Count &PopulationState::at(int age, core::Gender gender) const {
    if (age < 0) {
        throw std::out_of_range(fmt::format("Negative population age: {}.", age));
    }

    return buckets_(static_cast<std::size_t>(age), core::gender_index(gender));
}

core::Count PopulationState::total(core::Gender gender) const {
    core::Count sum{};
    for (auto age = 0; age < bucket_count(); age++) {
        sum = core::MathHelper::saturating_add(sum, at(age, gender));
    }

    return sum;
}

core::Count PopulationState::total() const {
    return core::MathHelper::saturating_add(total(core::Gender::male),
                                            total(core::Gender::female));
}

CohortFertility &PopulationState::cohorts() noexcept { return cohorts_; }

const CohortFertility &PopulationState::cohorts() const noexcept { return cohorts_; }

AgeGenderMap PopulationState::snapshot() const {
    auto result = AgeGenderMap{};
    for (auto age = 0; age < bucket_count(); age++) {
        result.males.emplace(age, at(age, core::Gender::male));
        result.females.emplace(age, at(age, core::Gender::female));
    }

    return result;
}
} // namespace spop
