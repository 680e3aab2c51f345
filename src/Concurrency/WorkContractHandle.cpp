/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Scribe Core project.
 */

#include "WorkContractHandle.h"
#include "WorkContractGroup.h"
#include <sstream>

namespace Scribe {
namespace Core {
namespace Concurrency {

    ScheduleResult WorkContractHandle::schedule() {
        if (!_owner) return ScheduleResult::Invalid;
        return _owner->scheduleContract(*this);
    }

    ScheduleResult WorkContractHandle::unschedule() {
        if (!_owner) return ScheduleResult::Invalid;
        return _owner->unscheduleContract(*this);
    }

    bool WorkContractHandle::valid() const {
        return _owner && _owner->isValidHandle(*this);
    }

    void WorkContractHandle::release() {
        if (_owner) {
            _owner->releaseContract(*this);
        }
        // Clear stamped identity to make subsequent calls fast no-ops
        _owner = nullptr;
        _index = 0;
        _generation = 0;
    }

    bool WorkContractHandle::isScheduled() const {
        if (!_owner) return false;
        return _owner->getContractState(*this) == ContractState::Scheduled;
    }

    std::string WorkContractHandle::toString() const {
        std::ostringstream oss;
        oss << "WorkContractHandle@" << static_cast<const void*>(this);
        if (_owner) {
            oss << "(owner=" << static_cast<const void*>(_owner) << ", idx=" << _index << ", gen=" << _generation << ")";
        } else {
            oss << "(invalid)";
        }
        return oss.str();
    }

} // namespace Concurrency
} // namespace Core
} // namespace Scribe
