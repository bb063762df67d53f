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
 * \file railnet/SignalHeadController.hxx
 *
 * Two-LED signal heads on GPIO extender boards.
 *
 * @date 7 March 2024
 */

#ifndef _RAILNET_SIGNALHEADCONTROLLER_HXX_
#define _RAILNET_SIGNALHEADCONTROLLER_HXX_

#include <map>

#include "railnet/BlinkScheduler.hxx"
#include "railnet/CommandDispatcher.hxx"
#include "railnet/Hardware.hxx"
#include "railnet/ResourceRegistry.hxx"

namespace railnet
{

/** Handles OUT_SH commands. Every aspect change first stops the blink task
 * of the head, then drives the static LED combination or hands the
 * flashing LED to the BlinkScheduler.
 */
class SignalHeadController : public CommandHandler
{
public:
    /** Constructor.
     * @param hw creates the extender boards, not owned
     * @param blinker runs the flashing aspects, not owned
     */
    SignalHeadController(HardwareProvider *hw, BlinkScheduler *blinker);

    /** Changes the aspect of a head.
     * @param head_id signal head identity
     * @param board I2C address of the extender
     * @param red_pin extender pin of the red LED
     * @param green_pin extender pin of the green LED
     * @param aspect new aspect
     * @return nullptr on success, else a reason token
     */
    const char *set_aspect(const string &head_id, int board, int red_pin,
        int green_pin, Aspect aspect);

    const char *handle_command(const Command &cmd, FrameSink *reply) override;

    /** Looks up the current aspect of a head.
     * @param head_id signal head identity
     * @param aspect receives the aspect
     * @return false if the head was never commanded
     */
    bool current_aspect(const string &head_id, Aspect *aspect);

    /// @return number of extender boards initialized so far.
    size_t board_count()
    {
        return boards_.size();
    }

private:
    /// Last applied state of one head.
    /** Puts a pin back to the level it had before a failed aspect change,
     * and logs the pin if that fails too.
     */
    void restore_pin(const string &head_id, const char *color, int pin,
        Gpio *gpio, bool level);

    struct HeadState
    {
        int board;
        int redPin;
        int greenPin;
        Aspect aspect;
    };

    HardwareProvider *hw_;
    BlinkScheduler *blinker_;
    ResourceRegistry<int, GpioBank> boards_;
    /// serializes aspect changes and guards heads_
    OSMutex lock_;
    std::map<string, HeadState> heads_;

    DISALLOW_COPY_AND_ASSIGN(SignalHeadController);
};

} // namespace railnet

#endif // _RAILNET_SIGNALHEADCONTROLLER_HXX_
