#pragma once

#include <roster/roster_store.hpp>

#include <memory>

/**
 * Open the roster store described by the current configuration. The
 * database defaults to roster.sqlite in the XDG data directory. Throws a
 * StoreError if it cannot be opened.
 */
std::unique_ptr<RosterStore> open_store();

/**
 * Reload the configuration, and close the logger (so that it closes its
 * files etc, to take into account the new configuration). Then reopen the
 * store; if that fails, the previous one is kept.
 */
void reload_process(std::unique_ptr<RosterStore>& store);
