/**
 * @file scoped_checkout.cpp
 * @brief Checkout ownership and per-checkout locking
 */

#include "evmverify/checkout.hpp"

#include <system_error>

namespace evmverify::checkout {

std::mutex& CheckoutLocks::for_location(const std::filesystem::path& location)
{
    std::lock_guard<std::mutex> guard(m_guard);
    auto& slot = m_locks[location.lexically_normal().generic_string()];
    if (!slot) {
        slot = std::make_unique<std::mutex>();
    }
    return *slot;
}

ScopedCheckout::~ScopedCheckout()
{
    release();
}

ScopedCheckout::ScopedCheckout(ScopedCheckout&& other) noexcept
    : m_handle(std::move(other.m_handle))
    , m_lock(std::move(other.m_lock))
    , m_active(other.m_active)
{
    other.m_active = false;
}

ScopedCheckout& ScopedCheckout::operator=(ScopedCheckout&& other) noexcept
{
    if (this != &other) {
        release();
        m_handle = std::move(other.m_handle);
        m_lock = std::move(other.m_lock);
        m_active = other.m_active;
        other.m_active = false;
    }
    return *this;
}

ScopedCheckout ScopedCheckout::persistent(std::filesystem::path location,
                                          std::unique_lock<std::mutex> lock)
{
    ScopedCheckout scoped;
    scoped.m_handle = CheckoutHandle{.location = std::move(location),
                                     .is_ephemeral = false,
                                     .removal_root = {}};
    scoped.m_lock = std::move(lock);
    scoped.m_active = true;
    return scoped;
}

ScopedCheckout ScopedCheckout::ephemeral(CheckoutHandle handle)
{
    ScopedCheckout scoped;
    handle.is_ephemeral = true;
    if (handle.removal_root.empty()) {
        handle.removal_root = handle.location;
    }
    scoped.m_handle = std::move(handle);
    scoped.m_active = true;
    return scoped;
}

void ScopedCheckout::release() noexcept
{
    if (!m_active) {
        return;
    }
    m_active = false;
    if (m_handle.is_ephemeral && !m_handle.removal_root.empty()) {
        std::error_code ec;
        std::filesystem::remove_all(m_handle.removal_root, ec);
    }
    if (m_lock.owns_lock()) {
        m_lock.unlock();
    }
}

}  // namespace evmverify::checkout
