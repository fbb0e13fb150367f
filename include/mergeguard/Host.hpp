/**
 * @file Host.hpp
 * @brief Request handlers of a host that stores profiles and settings
 *
 * Transport-free versions of the routes an HTTP host would expose. Each
 * handler returns a status code and a JSON body; mapping them onto a
 * real server is left to the embedding application.
 */

#ifndef MERGEGUARD_HOST_HPP
#define MERGEGUARD_HOST_HPP

#include "mergeguard/Outcome.hpp"
#include "mergeguard/Policy.hpp"
#include "mergeguard/Value.hpp"
#include <string>

namespace mergeguard {

struct Response {
    int status = 200;
    Value body = Value::object();
};

/**
 * @brief 400 response listing every violation of a rejected outcome
 */
Response rejection_response(const MergeOutcome& outcome, const std::string& error);

/**
 * @brief In-memory user profiles updated from request bodies
 */
class ProfileStore {
public:
    /// Seeded with users "alice" and "bob", both with role "user"
    ProfileStore();

    /// @param users Mapping of username → profile mapping
    explicit ProfileStore(Value users);

    /**
     * @brief Merge updates into a user's profile
     *
     * 404 for unknown users, 400 if updates is not a mapping or the merge
     * is rejected, 200 with the committed profile otherwise.
     */
    Response update_profile(const std::string& username, const Value& updates);

    /**
     * @brief 200 only if the user's own "role" entry is "admin", else 403
     */
    Response admin_check(const std::string& username) const;

    const Value& users() const noexcept { return users_; }

    /// Allow-list {displayName, email, bio, avatar}, all strings
    static const MergePolicy& profile_policy();

private:
    Value users_;
};

/// {"timeout": 30, "retries": 3, "debug": false}
Value default_settings();

/// Schema {timeout: number, retries: number, debug: boolean}
const MergePolicy& settings_update_policy();

/**
 * @brief Merge a settings body over default_settings()
 *
 * 200 body: {"message": ..., "timeout": <timeout in milliseconds>}
 */
Response apply_settings(const Value& body);

/**
 * @brief Render a fixed page for a template name
 *
 * Request options are never passed to the renderer. The name is HTML
 * escaped.
 */
Response render_template(const std::string& name);

} // namespace mergeguard

#endif // MERGEGUARD_HOST_HPP
