/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Scribe Core project.
 */

#include "WorkContractGroup.h"
#include "../CoreCommon.h"
#include "../Logging/Logger.h"
#include <algorithm>
#include <limits>
#include <sstream>

namespace Scribe {
namespace Core {
namespace Concurrency {

    WorkContractGroup::WorkContractGroup(size_t capacity, std::string name)
        : _name(std::move(name)) {
        growPool(std::max<size_t>(capacity, 1));
    }

    WorkContractGroup::~WorkContractGroup() {
        std::lock_guard<std::mutex> lock(_mutex);
        if (!_readyContracts.empty()) {
            SCRIBE_LOG_DEBUG_CAT("WorkContractGroup",
                _name + " destroyed with " + std::to_string(_readyContracts.size()) + " contracts still scheduled");
        }
    }

    void WorkContractGroup::growPool(size_t additional) {
        const size_t oldSize = _contracts.size();
        _contracts.resize(oldSize + additional);
        // Push in reverse so the lowest index is handed out first
        for (size_t i = oldSize + additional; i > oldSize; --i) {
            _freeList.push_back(static_cast<uint32_t>(i - 1));
        }
    }

    WorkContractHandle WorkContractGroup::createContract(Work work) {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_freeList.empty()) {
            growPool(_contracts.size());
        }
        const uint32_t index = _freeList.back();
        _freeList.pop_back();

        auto& slot = _contracts[index];
        SCRIBE_ASSERT(slot.state == ContractState::Free, "free list handed out a live slot");
        slot.work = std::move(work);
        slot.state = ContractState::Allocated;
        ++_activeCount;
        return WorkContractHandle(this, index, slot.generation);
    }

    WorkContractHandle WorkContractGroup::post(Work work) {
        auto handle = createContract(std::move(work));
        handle.schedule();
        return handle;
    }

    bool WorkContractGroup::isValidHandleLocked(const WorkContractHandle& handle) const {
        if (handle._owner != this) return false;
        if (handle._index >= _contracts.size()) return false;
        const auto& slot = _contracts[handle._index];
        return slot.state != ContractState::Free && slot.generation == handle._generation;
    }

    bool WorkContractGroup::isValidHandle(const WorkContractHandle& handle) const {
        std::lock_guard<std::mutex> lock(_mutex);
        return isValidHandleLocked(handle);
    }

    ContractState WorkContractGroup::getContractState(const WorkContractHandle& handle) const {
        std::lock_guard<std::mutex> lock(_mutex);
        if (!isValidHandleLocked(handle)) return ContractState::Free;
        return _contracts[handle._index].state;
    }

    ScheduleResult WorkContractGroup::scheduleContract(const WorkContractHandle& handle) {
        std::lock_guard<std::mutex> lock(_mutex);
        if (!isValidHandleLocked(handle)) return ScheduleResult::Invalid;

        auto& slot = _contracts[handle._index];
        if (slot.state == ContractState::Scheduled) return ScheduleResult::AlreadyScheduled;

        slot.state = ContractState::Scheduled;
        _readyContracts.push_back(handle._index);
        return ScheduleResult::Scheduled;
    }

    ScheduleResult WorkContractGroup::unscheduleContract(const WorkContractHandle& handle) {
        std::lock_guard<std::mutex> lock(_mutex);
        if (!isValidHandleLocked(handle)) return ScheduleResult::Invalid;

        auto& slot = _contracts[handle._index];
        if (slot.state == ContractState::Scheduled) {
            auto it = std::find(_readyContracts.begin(), _readyContracts.end(), handle._index);
            if (it != _readyContracts.end()) {
                _readyContracts.erase(it);
            }
            slot.state = ContractState::Allocated;
        }
        return ScheduleResult::NotScheduled;
    }

    void WorkContractGroup::releaseContract(const WorkContractHandle& handle) {
        std::lock_guard<std::mutex> lock(_mutex);
        if (!isValidHandleLocked(handle)) return;

        auto& slot = _contracts[handle._index];
        if (slot.state == ContractState::Scheduled) {
            auto it = std::find(_readyContracts.begin(), _readyContracts.end(), handle._index);
            if (it != _readyContracts.end()) {
                _readyContracts.erase(it);
            }
        }
        slot.work = nullptr;
        returnSlotToFreeList(handle._index);
    }

    void WorkContractGroup::returnSlotToFreeList(uint32_t index) {
        auto& slot = _contracts[index];
        // Invalidate outstanding handles before the slot can be reused
        ++slot.generation;
        slot.state = ContractState::Free;
        _freeList.push_back(index);
        --_activeCount;
    }

    size_t WorkContractGroup::executeMainThreadWork(size_t maxContracts) {
        size_t executed = 0;
        while (executed < maxContracts) {
            Work task;
            {
                std::lock_guard<std::mutex> lock(_mutex);
                if (_readyContracts.empty()) break;
                const uint32_t index = _readyContracts.front();
                _readyContracts.pop_front();

                // Move work out and free the slot BEFORE executing to allow re-entrance
                task = std::move(_contracts[index].work);
                _contracts[index].work = nullptr;
                returnSlotToFreeList(index);
            }

            if (task) {
                task();
            }
            ++executed;
        }
        return executed;
    }

    size_t WorkContractGroup::executeAllMainThreadWork() {
        size_t total = 0;
        for (;;) {
            size_t ran = executeMainThreadWork(std::numeric_limits<size_t>::max());
            if (ran == 0) break;
            total += ran;
        }
        return total;
    }

    bool WorkContractGroup::hasScheduledWork() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return !_readyContracts.empty();
    }

    size_t WorkContractGroup::scheduledCount() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _readyContracts.size();
    }

    size_t WorkContractGroup::activeCount() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _activeCount;
    }

    size_t WorkContractGroup::capacity() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _contracts.size();
    }

    std::string WorkContractGroup::debugString() const {
        std::lock_guard<std::mutex> lock(_mutex);
        std::ostringstream oss;
        oss << "WorkContractGroup(" << _name << ") capacity=" << _contracts.size()
            << " active=" << _activeCount << " scheduled=" << _readyContracts.size();
        return oss.str();
    }

} // namespace Concurrency
} // namespace Core
} // namespace Scribe
