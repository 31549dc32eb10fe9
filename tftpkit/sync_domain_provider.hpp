/*!
    \file "sync_domain_provider.hpp"

    Formatting: 4 spaces/tab, 120 columns.
    Doc-tool: Doxygen (http://www.doxygen.com/)
*/


#ifndef SYNC_DOMAIN_PROVIDER_HPP__C6F1AA1E_AA74_4437_B2D0_4CDE65F5BB88__INCLUDED
#define SYNC_DOMAIN_PROVIDER_HPP__C6F1AA1E_AA74_4437_B2D0_4CDE65F5BB88__INCLUDED


#pragma once


#include <mutex>
#include <tftpkit/tftpkit_env.hpp>


/**
 * Brackets a synchronization domain, e.g.
 *
 *     ENTER_SYNC_DOMAIN(sync_domain_lock())
 *     ...
 *     LEAVE_SYNC_DOMAIN()
 */
#define ENTER_SYNC_DOMAIN(lock) { std::lock_guard<tftpkit::lock_type> sync_domain_guard__(lock);
#define LEAVE_SYNC_DOMAIN() }


namespace tftpkit {


typedef recursive_mutex lock_type;


/**
 * Provides the lock that serializes an object's public interface against its own I/O completion handlers.
 *
 * Several objects may share one synchronization domain by passing the same lock on construction;
 * when no lock is passed the object owns a private one.
 */
class sync_domain_provider
{
public:
    lock_type& sync_domain_lock() const { return nullptr == mp_sync_domain_lock ? m_lock : *mp_sync_domain_lock; }

protected:
    explicit sync_domain_provider(lock_type *sync_domain_lock = nullptr) : mp_sync_domain_lock(sync_domain_lock) {}
    ~sync_domain_provider() {}

private:
    lock_type *mp_sync_domain_lock;
    mutable lock_type m_lock;
};


} // namespace tftpkit {


#endif // #ifndef SYNC_DOMAIN_PROVIDER_HPP__C6F1AA1E_AA74_4437_B2D0_4CDE65F5BB88__INCLUDED


/*
    End of "sync_domain_provider.hpp"
*/
