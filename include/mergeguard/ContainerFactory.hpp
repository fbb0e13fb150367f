/**
 * @file ContainerFactory.hpp
 * @brief Creates the containers a merge materializes
 *
 * Containers from the factory hold no entries and have no link to the
 * ambient namespace. One factory lives for the duration of one merge
 * call, so factories are never shared between threads.
 */

#ifndef MERGEGUARD_CONTAINER_FACTORY_HPP
#define MERGEGUARD_CONTAINER_FACTORY_HPP

#include "mergeguard/Value.hpp"
#include <cstddef>

namespace mergeguard {

class ContainerFactory {
public:
    Value new_mapping();
    Value new_sequence();

    /// Number of containers created so far
    std::size_t created() const noexcept { return created_; }

private:
    std::size_t created_ = 0;
};

} // namespace mergeguard

#endif // MERGEGUARD_CONTAINER_FACTORY_HPP
