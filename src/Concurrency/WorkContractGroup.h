/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Scribe Core project.
 */

/**
 * @file WorkContractGroup.h
 * @brief Cooperative run queue of work contracts pumped by a single host thread
 *
 * A WorkContractGroup owns a pool of contract slots and a FIFO ready queue. Work is
 * created with createContract(), queued with WorkContractHandle::schedule(), and run
 * when the host calls executeMainThreadWork() or executeAllMainThreadWork(). Nothing
 * runs in parallel: every contract executes on whichever thread pumps the group, in
 * the order it was scheduled.
 *
 * Scheduling is mutex-guarded so other threads may post work, but only one thread
 * may pump at a time.
 *
 * @code
 * WorkContractGroup group(256, "IO");
 * group.post([]{ SCRIBE_LOG_INFO("first"); });
 * group.post([]{ SCRIBE_LOG_INFO("second"); });
 * group.executeAllMainThreadWork();   // logs "first" then "second"
 * @endcode
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <vector>
#include "WorkContractHandle.h"

namespace Scribe {
namespace Core {
namespace Concurrency {

    class WorkContractGroup {
    public:
        using Work = std::function<void()>;

        /**
         * @brief Creates a group with an initial slot pool
         * @param capacity Initial number of contract slots; the pool grows on demand
         * @param name Name used in debug strings
         */
        explicit WorkContractGroup(size_t capacity = 256, std::string name = "WorkContractGroup");
        ~WorkContractGroup();

        WorkContractGroup(const WorkContractGroup&) = delete;
        WorkContractGroup& operator=(const WorkContractGroup&) = delete;

        /**
         * @brief Allocates a contract slot holding the given work
         * @return Handle in the Allocated state; call schedule() to queue it
         */
        WorkContractHandle createContract(Work work);

        /**
         * @brief Shorthand for createContract(work).schedule()
         * @return Handle to the queued contract
         */
        WorkContractHandle post(Work work);

        /**
         * @brief Runs up to maxContracts scheduled contracts in FIFO order
         *
         * Contracts scheduled by the work being run are queued behind everything already
         * waiting, so a contract that reschedules itself yields to other pending work.
         * @return Number of contracts executed
         */
        size_t executeMainThreadWork(size_t maxContracts);

        /**
         * @brief Runs contracts until the ready queue is empty
         *
         * Includes contracts scheduled while draining.
         * @return Number of contracts executed
         */
        size_t executeAllMainThreadWork();

        bool hasScheduledWork() const;
        size_t scheduledCount() const;
        size_t activeCount() const;
        size_t capacity() const;
        const std::string& name() const noexcept { return _name; }

        std::string debugString() const;

    private:
        friend class WorkContractHandle;

        struct ContractSlot {
            Work work;
            ContractState state = ContractState::Free;
            uint32_t generation = 1;
        };

        ScheduleResult scheduleContract(const WorkContractHandle& handle);
        ScheduleResult unscheduleContract(const WorkContractHandle& handle);
        void releaseContract(const WorkContractHandle& handle);
        bool isValidHandle(const WorkContractHandle& handle) const;
        ContractState getContractState(const WorkContractHandle& handle) const;

        // Caller holds _mutex
        bool isValidHandleLocked(const WorkContractHandle& handle) const;
        void returnSlotToFreeList(uint32_t index);
        void growPool(size_t additional);

        std::vector<ContractSlot> _contracts;
        std::vector<uint32_t> _freeList;
        std::deque<uint32_t> _readyContracts;
        size_t _activeCount = 0;
        std::string _name;
        mutable std::mutex _mutex;
    };

} // namespace Concurrency
} // namespace Core
} // namespace Scribe
