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
 * \file railnet/TurnoutController.hxx
 *
 * Drives turnout servos on the actuator host.
 *
 * @date 6 March 2024
 */

#ifndef _RAILNET_TURNOUTCONTROLLER_HXX_
#define _RAILNET_TURNOUTCONTROLLER_HXX_

#include <map>

#include "railnet/CommandDispatcher.hxx"
#include "railnet/Hardware.hxx"
#include "railnet/ResourceRegistry.hxx"

namespace railnet
{

/** Handles OUT_TO commands. Servo address n is channel n % 16 of servo
 * board n / 16; each board is initialized on first use.
 */
class TurnoutController : public CommandHandler
{
public:
    /** Constructor.
     * @param hw creates the servo boards, not owned
     */
    TurnoutController(HardwareProvider *hw);

    /** Moves a turnout.
     * @param servo_address servo address
     * @param thrown_angle angle of the thrown position
     * @param closed_angle angle of the closed position
     * @param active true for closed, false for thrown
     * @return nullptr on success, else a reason token; the servo is not
     * moved in that case
     */
    const char *set_position(int servo_address, int thrown_angle,
        int closed_angle, bool active);

    const char *handle_command(const Command &cmd, FrameSink *reply) override;

    /** Looks up the last angle written to a servo.
     * @param servo_address servo address
     * @param angle receives the angle
     * @return false if the servo was never moved
     */
    bool last_angle(int servo_address, int *angle);

    /// @return number of servo boards initialized so far.
    size_t board_count()
    {
        return boards_.size();
    }

private:
    HardwareProvider *hw_;
    ResourceRegistry<int, ServoController> boards_;
    OSMutex lock_;
    /// servo address -> last angle written
    std::map<int, int> angles_;

    DISALLOW_COPY_AND_ASSIGN(TurnoutController);
};

} // namespace railnet

#endif // _RAILNET_TURNOUTCONTROLLER_HXX_
