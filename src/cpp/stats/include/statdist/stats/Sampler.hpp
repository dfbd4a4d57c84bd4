/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <range/v3/view/generate.hpp>
#include <range/v3/view/generate_n.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <type_traits>
#include <utility>

//-------------------------------------------------------------------------

namespace statdist::stats
{

//-------------------------------------------------------------------------

template<typename T>
struct Sampler
{
    virtual ~Sampler() noexcept = default;

    [[nodiscard]] virtual T sample() = 0;
};

using ContinuousSampler = Sampler<double>;
using DiscreteSampler = Sampler<int32_t>;

//-------------------------------------------------------------------------

template<typename T, typename Fn>
requires std::is_invocable_r_v<T, Fn&>
class FunctionSampler : public Sampler<T>
{
public:
    explicit FunctionSampler(Fn fn) : m_fn{std::move(fn)} {}

    virtual T sample() override { return m_fn(); }

private:
    Fn m_fn;
};

template<typename T, typename Fn>
[[nodiscard]] std::unique_ptr<Sampler<T>> makeSampler(Fn&& fn)
{
    return std::make_unique<FunctionSampler<T, std::decay_t<Fn>>>(std::forward<Fn>(fn));
}

//-------------------------------------------------------------------------

/**
 * Lazy, unbounded sequence of variates drawn from the sampler. The sampler
 * must outlive the view; each call starts a new sequence.
 */
template<typename T>
[[nodiscard]] auto samples(Sampler<T>& sampler)
{
    return ranges::views::generate([&sampler] { return sampler.sample(); });
}

// Sequence of exactly n variates.
template<typename T>
[[nodiscard]] auto samples(Sampler<T>& sampler, std::size_t n)
{
    return ranges::views::generate_n([&sampler] { return sampler.sample(); }, n);
}

//-------------------------------------------------------------------------

}  // namespace statdist::stats

//-------------------------------------------------------------------------
