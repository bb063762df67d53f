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
 * \file railnet/SignalHeadController.cxx
 *
 * Implementation of the signal head aspect state machine.
 *
 * @date 7 March 2024
 */

#include "railnet/SignalHeadController.hxx"

#include "utils/logging.h"

namespace railnet
{

SignalHeadController::SignalHeadController(
    HardwareProvider *hw, BlinkScheduler *blinker)
    : hw_(hw)
    , blinker_(blinker)
{
    HASSERT(hw_);
    HASSERT(blinker_);
}

const char *SignalHeadController::set_aspect(const string &head_id,
    int board, int red_pin, int green_pin, Aspect aspect)
{
    GpioBank *bank = boards_.get_or_create(board,
        [this](const int &addr) { return hw_->create_gpio_extender(addr); });
    if (!bank)
    {
        LOG_ERROR("Could not initialize board 0x%02x for signal head %s",
            board, head_id.c_str());
        return reason::BOARD_INIT_FAILED;
    }
    if (red_pin < 0 || green_pin < 0 || (unsigned)red_pin >= bank->size() ||
        (unsigned)green_pin >= bank->size())
    {
        return reason::BAD_PIN;
    }
    Gpio *red = bank->pin(red_pin);
    Gpio *green = bank->pin(green_pin);

    OSMutexLock l(&lock_);
    auto it = heads_.find(head_id);
    if (it == heads_.end())
    {
        // A new head starts dark; the board init drove its pins low.
        HeadState s;
        s.board = board;
        s.redPin = red_pin;
        s.greenPin = green_pin;
        s.aspect = Aspect::DARK;
        it = heads_.insert(std::make_pair(head_id, s)).first;
    }
    HeadState previous = it->second;
    if (blinker_->cancel(head_id))
    {
        LOG(VERBOSE, "%s: stopped blinking", head_id.c_str());
    }
    bool red_was = red->is_set();
    bool green_was = green->is_set();

    bool ok = true;
    switch (aspect)
    {
        case Aspect::RED:
            ok = red->set() && green->clr();
            break;
        case Aspect::GREEN:
            ok = red->clr() && green->set();
            break;
        case Aspect::FLASH_RED:
            ok = green->clr();
            if (ok)
            {
                blinker_->start(head_id, red);
            }
            break;
        case Aspect::FLASH_GREEN:
            ok = red->clr();
            if (ok)
            {
                blinker_->start(head_id, green);
            }
            break;
        case Aspect::DARK:
        default:
            ok = red->clr() && green->clr();
            break;
    }
    if (!ok)
    {
        LOG_ERROR("Could not set the LEDs of signal head %s on board 0x%02x",
            head_id.c_str(), board);
        restore_pin(head_id, "red", red_pin, red, red_was);
        restore_pin(head_id, "green", green_pin, green, green_was);
        if (previous.board == board && previous.redPin == red_pin &&
            previous.greenPin == green_pin)
        {
            if (previous.aspect == Aspect::FLASH_RED)
            {
                blinker_->start(head_id, red);
            }
            else if (previous.aspect == Aspect::FLASH_GREEN)
            {
                blinker_->start(head_id, green);
            }
        }
        return reason::BOARD_WRITE_FAILED;
    }
    it->second.board = board;
    it->second.redPin = red_pin;
    it->second.greenPin = green_pin;
    it->second.aspect = aspect;
    LOG(VERBOSE, "%s: %s", head_id.c_str(), aspect_name(aspect));
    return nullptr;
}

void SignalHeadController::restore_pin(const string &head_id,
    const char *color, int pin, Gpio *gpio, bool level)
{
    if (gpio->is_set() == level)
    {
        return;
    }
    if (!gpio->write(level ? Gpio::SET : Gpio::CLR))
    {
        LOG_ERROR("%s: %s LED (pin %d) left %s", head_id.c_str(), color, pin,
            level ? "off" : "on");
    }
}

const char *SignalHeadController::handle_command(
    const Command &cmd, FrameSink *reply)
{
    HASSERT(cmd.type == Command::SIGNAL_HEAD_SET);
    return set_aspect(
        cmd.headId, cmd.boardAddress, cmd.redPin, cmd.greenPin, cmd.aspect);
}

bool SignalHeadController::current_aspect(const string &head_id, Aspect *aspect)
{
    OSMutexLock l(&lock_);
    auto it = heads_.find(head_id);
    if (it == heads_.end())
    {
        return false;
    }
    *aspect = it->second.aspect;
    return true;
}

} // namespace railnet
