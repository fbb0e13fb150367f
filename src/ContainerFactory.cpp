/**
 * @file ContainerFactory.cpp
 */

#include "mergeguard/ContainerFactory.hpp"

namespace mergeguard {

Value ContainerFactory::new_mapping() {
    ++created_;
    return Value::object();
}

Value ContainerFactory::new_sequence() {
    ++created_;
    return Value::array();
}

} // namespace mergeguard
