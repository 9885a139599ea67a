#pragma once
#include "StablePop.Core/array2d.h"
#include "StablePop.Core/forward_type.h"

#include <map>

namespace spop {

/// @brief Population snapshot, counts by age exposed as one map per gender
struct AgeGenderMap {
    /// @brief Males count by age
    std::map<int, core::Count> males;

    /// @brief Females count by age
    std::map<int, core::Count> females;

    /// @brief Gets the total population count
    /// @return Total count
    core::Count count() const noexcept;

    /// @brief Gets the total count of a gender
    /// @param gender The gender enumeration
    /// @return Total gender count
    core::Count count_gender(core::Gender gender) const noexcept;

    /// @brief Gets the total count of an age, both genders
    /// @param age The age to count
    /// @return Total age count, zero for unknown ages
    core::Count count_age(int age) const noexcept;

    /// @brief Gets the count of an age and gender bucket
    /// @param age The bucket age
    /// @param gender The bucket gender
    /// @return The bucket count
    /// @throws std::out_of_range for unknown age
    core::Count count_age_gender(int age, core::Gender gender) const;

    bool operator==(const AgeGenderMap &rhs) const = default;
};

/// @brief Fertility accounting of one female birth cohort
struct CohortData {
    /// @brief Size of the female birth cohort, lifetime exposure base
    core::Count females{};

    /// @brief Total children borne by women of the cohort
    core::Count births{};

    /// @brief Gets the completed total fertility of the cohort
    /// @return The births per female ratio
    /// @throws core::NoDataError for cohort with zero females
    double ratio() const;

    bool operator==(const CohortData &rhs) const = default;
};

/// @brief Cohort fertility ledger keyed by birth year, which can be negative
class CohortFertility {
  public:
    using container_type = std::map<int, CohortData>;
    using const_iterator = container_type::const_iterator;

    /// @brief Adds children borne by mothers of a birth year cohort
    /// @param birth_year The mothers birth year
    /// @param births Number of children
    void add_births(int birth_year, core::Count births);

    /// @brief Adds newborn females to the cohort of their birth year
    /// @param birth_year The cohort birth year
    /// @param females Number of newborn females
    void add_females(int birth_year, core::Count females);

    /// @brief Removes all cohorts born outside [first_year, last_year], inverted range removes all
    /// @param first_year The first birth year to keep
    /// @param last_year The last birth year to keep
    void retain(int first_year, int last_year);

    /// @brief Gets the mean completed fertility over cohorts with non-zero exposure base
    /// @return Average births per female
    /// @throws core::NoDataError if no cohort has females
    double avg() const;

    /// @brief Gets a cohort data by birth year
    /// @param birth_year The cohort birth year
    /// @return The cohort data
    /// @throws std::out_of_range for unknown birth year
    const CohortData &at(int birth_year) const;

    bool contains(int birth_year) const noexcept;
    std::size_t size() const noexcept;
    bool empty() const noexcept;
    const_iterator begin() const noexcept;
    const_iterator end() const noexcept;

    bool operator==(const CohortFertility &rhs) const = default;

  private:
    container_type data_;
};

/// @brief Mutable per-run cohort store, counts keyed by (age, gender)
///
/// @details Buckets cover ages [0, max_age + 1], the last bucket receives
/// the people ageing out of the tracked range and is cleared by the deaths pass.
class PopulationState {
  public:
    PopulationState() = delete;

    /// @brief Initialises a new instance of the PopulationState class with empty buckets
    /// @param max_age The maximum tracked age
    /// @throws std::invalid_argument for negative maximum age
    explicit PopulationState(int max_age);

    /// @brief Gets the maximum tracked age
    int max_age() const noexcept;

    /// @brief Gets the number of age buckets, including the overflow bucket
    int bucket_count() const noexcept;

    /// @brief Gets a bucket count
    /// @param age The bucket age
    /// @param gender The bucket gender
    /// @return Reference to the bucket count
    /// @throws std::out_of_range for age outside [0, max_age + 1]
    core::Count &at(int age, core::Gender gender);

    /// @brief Gets a read-only bucket count
    /// @param age The bucket age
    /// @param gender The bucket gender
    /// @return The bucket count
    /// @throws std::out_of_range for age outside [0, max_age + 1]
    const core::Count &at(int age, core::Gender gender) const;

    /// @brief Gets the total count of a gender
    core::Count total(core::Gender gender) const;

    /// @brief Gets the total population count
    core::Count total() const;

    /// @brief Gets the cohort fertility ledger
    CohortFertility &cohorts() noexcept;

    /// @brief Gets the read-only cohort fertility ledger
    const CohortFertility &cohorts() const noexcept;

    /// @brief Creates a snapshot of the current counts
    /// @return The population snapshot
    AgeGenderMap snapshot() const;

  private:
    int max_age_{};
    core::CountArray2D buckets_;
    CohortFertility cohorts_;
};
} // namespace spop
