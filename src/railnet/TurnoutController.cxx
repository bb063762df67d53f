/** \copyright
 * Copyright (c) 2024, railnet contributors
 * All rights reserved.
 *
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 *
 *  - Redistributions of source code must retain the above copyright notice,
 *    this list of conditions and the following disclaimer.
 *
 *  - Redistributions in binary form must reproduce the above copyright notice,
 *    this list of conditions and the following disclaimer in the documentation
 *    and/or other materials provided with the distribution.
 *
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
 * AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
 * IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE
 * ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR CONTRIBUTORS BE
 * LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR
 * CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF
 * SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
 * INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN
 * CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE)
 * ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE
 * POSSIBILITY OF SUCH DAMAGE.
 *
 * \file railnet/TurnoutController.cxx
 *
 * Implementation of the turnout controller.
 *
 * @date 6 March 2024
 */

#include "railnet/TurnoutController.hxx"

#include "utils/logging.h"

namespace railnet
{

TurnoutController::TurnoutController(HardwareProvider *hw)
    : hw_(hw)
{
    HASSERT(hw_);
}

const char *TurnoutController::set_position(
    int servo_address, int thrown_angle, int closed_angle, bool active)
{
    if (servo_address < 0 || servo_address > Defs::MAX_SERVO_ADDRESS)
    {
        return reason::BAD_SERVO;
    }
    int angle = active ? closed_angle : thrown_angle;
    if (angle < 0 || angle > Defs::MAX_ANGLE)
    {
        return reason::BAD_ANGLE;
    }
    int board_index = servo_address / Defs::SERVO_CHANNELS;
    unsigned channel = servo_address % Defs::SERVO_CHANNELS;

    bool created;
    ServoController *board = boards_.get_or_create(board_index,
        [this](const int &b) { return hw_->create_servo_controller(b); },
        &created);
    if (!board)
    {
        LOG_ERROR("Could not initiate servo controller for servo %d",
            servo_address);
        return reason::SERVO_INIT_FAILED;
    }
    if (created)
    {
        LOG(INFO, "Servo board %d initialized", board_index);
    }
    if (!board->set_angle(channel, angle))
    {
        LOG_ERROR("Could not move servo %d to %d", servo_address, angle);
        return reason::SERVO_WRITE_FAILED;
    }
    LOG(VERBOSE, "Servo %d set to %s (%d)", servo_address,
        active ? "CLOSED" : "THROWN", angle);
    OSMutexLock l(&lock_);
    angles_[servo_address] = angle;
    return nullptr;
}

const char *TurnoutController::handle_command(
    const Command &cmd, FrameSink *reply)
{
    HASSERT(cmd.type == Command::TURNOUT_SET);
    return set_position(
        cmd.servoAddress, cmd.thrownAngle, cmd.closedAngle, cmd.active);
}

bool TurnoutController::last_angle(int servo_address, int *angle)
{
    OSMutexLock l(&lock_);
    auto it = angles_.find(servo_address);
    if (it == angles_.end())
    {
        return false;
    }
    *angle = it->second;
    return true;
}

} // namespace railnet
