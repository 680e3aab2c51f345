/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the Scribe Core project.
 */

/**
 * @file WorkContractHandle.h
 * @brief Generation-stamped handle for scheduling and managing work contracts
 *
 * WorkContractHandle carries (owner + index + generation) stamped by WorkContractGroup.
 * The group is the source of truth; every query validates the stamp against the slot so a
 * handle to a contract that already ran (or was released) is reported as invalid.
 */

#pragma once

#include <cstdint>
#include <string>

namespace Scribe
{
namespace Core
{
namespace Concurrency
{

class WorkContractGroup;

/**
 * @brief States that a work contract can be in during its lifecycle
 */
enum class ContractState : uint32_t
{
    Free = 0,       ///< Contract slot is available for allocation
    Allocated = 1,  ///< Contract has been allocated but not scheduled
    Scheduled = 2   ///< Contract is queued and waiting for the next pump
};

/**
 * @brief Result of schedule/unschedule operations
 */
enum class ScheduleResult
{
    Scheduled,         ///< Contract is now scheduled (successful schedule operation)
    AlreadyScheduled,  ///< Contract was already scheduled (schedule operation failed)
    NotScheduled,      ///< Contract is not scheduled (successful unschedule operation)
    Invalid            ///< Invalid handle provided
};

/**
 * @class WorkContractHandle
 * @brief Copyable reference to a contract slot in a WorkContractGroup
 *
 * Copying a handle copies only its stamped identity. The group owns the work. The slot is
 * freed (generation advanced) immediately before the work runs, so once a contract starts
 * executing or is released every copy of the handle becomes invalid.
 *
 * @code
 * WorkContractGroup group(64, "IO");
 * auto h = group.createContract([]{ doWork(); });
 * if (h.schedule() == ScheduleResult::Scheduled) { // queued }
 * group.executeAllMainThreadWork();
 * @endcode
 */
class WorkContractHandle
{
private:
    friend class WorkContractGroup;

    WorkContractHandle(WorkContractGroup* group, uint32_t index, uint32_t generation) noexcept
        : _owner(group), _index(index), _generation(generation) {}

public:
    // Default: invalid (no stamped identity)
    WorkContractHandle() = default;

    /**
     * @brief Queues this contract behind all previously scheduled contracts
     *
     * Transitions Allocated -> Scheduled. No-op if already scheduled.
     * @return Scheduled, AlreadyScheduled, or Invalid
     */
    ScheduleResult schedule();

    /**
     * @brief Removes this contract from the ready queue
     * @return NotScheduled on success, or Invalid if the contract already ran
     */
    ScheduleResult unschedule();

    /**
     * @brief Checks whether this handle still refers to a live slot
     */
    bool valid() const;

    /**
     * @brief Frees this contract's slot without running it. After this, valid() is false.
     */
    void release();

    bool isScheduled() const;

    uint32_t handleIndex() const noexcept { return _index; }
    uint32_t handleGeneration() const noexcept { return _generation; }
    const WorkContractGroup* handleOwner() const noexcept { return _owner; }

    std::string toString() const;

private:
    WorkContractGroup* _owner = nullptr;
    uint32_t _index = 0;
    uint32_t _generation = 0;
};

}  // namespace Concurrency
}  // namespace Core
}  // namespace Scribe
