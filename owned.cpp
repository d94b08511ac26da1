// owned.cpp

#include "owned.hpp"

#include "errors.hpp"
#include "log.hpp"

namespace merkledrop {

bool Owned::only_owner(const Address& caller, std::string& err) const {
    if (caller != owner_) { err = errc::not_owner; return false; }
    err.clear();
    return true;
}

bool Owned::transfer_ownership(const Address& caller, const Address& new_owner, std::string& err) {
    if (!only_owner(caller, err)) return false;
    log_line(LogLevel::info, "owner_changed old=", hex_of(owner_), " new=", hex_of(new_owner));
    owner_ = new_owner;
    nominated_.reset();
    return true;
}

bool Owned::nominate_new_owner(const Address& caller, const Address& nominee, std::string& err) {
    if (!only_owner(caller, err)) return false;
    nominated_ = nominee;
    log_line(LogLevel::info, "owner_nominated nominee=", hex_of(nominee));
    return true;
}

bool Owned::accept_ownership(const Address& caller, std::string& err) {
    if (!nominated_ || *nominated_ != caller) { err = errc::not_nominated; return false; }
    log_line(LogLevel::info, "owner_changed old=", hex_of(owner_), " new=", hex_of(caller));
    owner_ = caller;
    nominated_.reset();
    err.clear();
    return true;
}

} // namespace merkledrop
