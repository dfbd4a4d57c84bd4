/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "statdist/stats/UniformDiscreteDistribution.hpp"

#include "common.hpp"
#include "statdist/stats/DistributionException.hpp"

//-------------------------------------------------------------------------

namespace statdist::stats
{

//-------------------------------------------------------------------------

UniformDiscreteDistribution::UniformDiscreteDistribution(int32_t lower, int32_t upper)
    : m_lower{lower},
      m_upper{upper},
      m_upperPlusLower{static_cast<double>(upper) + static_cast<double>(lower)},
      m_upperMinusLower{static_cast<double>(upper) - static_cast<double>(lower)},
      m_pmf{1.0 / (m_upperMinusLower + 1.0)}
{
    if (lower > upper) {
        throw DistributionException::lowerAboveUpper(lower, upper);
    }
}

//-------------------------------------------------------------------------

double UniformDiscreteDistribution::probability(int32_t x) const
{
    if (x < m_lower || x > m_upper) {
        return 0.0;
    }
    return m_pmf;
}

//-------------------------------------------------------------------------

double UniformDiscreteDistribution::logProbability(int32_t x) const
{
    if (x < m_lower || x > m_upper) {
        return -kInf;
    }
    return -std::log1p(m_upperMinusLower);
}

//-------------------------------------------------------------------------

double UniformDiscreteDistribution::cumulativeProbability(int32_t x) const
{
    if (x < m_lower) {
        return 0.0;
    }
    else if (x >= m_upper) {
        return 1.0;
    }
    return (static_cast<double>(x) - m_lower + 1.0) / (m_upperMinusLower + 1.0);
}

//-------------------------------------------------------------------------

double UniformDiscreteDistribution::survivalProbability(int32_t x) const
{
    if (x < m_lower) {
        return 1.0;
    }
    else if (x >= m_upper) {
        return 0.0;
    }
    return (static_cast<double>(m_upper) - x) / (m_upperMinusLower + 1.0);
}

//-------------------------------------------------------------------------

double UniformDiscreteDistribution::variance() const noexcept
{
    const double n = m_upperMinusLower + 1.0;
    return (n * n - 1.0) / 12.0;
}

//-------------------------------------------------------------------------

std::unique_ptr<DiscreteSampler> UniformDiscreteDistribution::createSampler(
    std::mt19937& rng) const
{
    return makeSampler<int32_t>(
        [&rng, dist = std::uniform_int_distribution<int32_t>{m_lower, m_upper}]() mutable {
            return dist(rng);
        });
}

//-------------------------------------------------------------------------

std::unique_ptr<UniformDiscreteDistribution> UniformDiscreteDistribution::fromXML(
    pugi::xml_node node)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    auto getAttr = [&](const char* name) {
        if (pugi::xml_attribute attr = node.attribute(name)) {
            return static_cast<int32_t>(attr.as_int());
        }
        throw std::invalid_argument{fmt::format(
            "{}: missing required attribute '{}'", ctx, name)};
    };

    const int32_t lower = getAttr("lower");
    const int32_t upper = getAttr("upper");
    return std::make_unique<UniformDiscreteDistribution>(lower, upper);
}

//-------------------------------------------------------------------------

}  // namespace statdist::stats

//-------------------------------------------------------------------------
