/*
 Copyright (C) 2026 Quaternion Risk Management Ltd
 All rights reserved.

 This file is part of HRE, a free-software/open-source library
 for hedge analytics of Monte Carlo contract valuations

 HRE is free software: you can redistribute it and/or modify it
 under the terms of the Modified BSD License.  You should have received a
 copy of the license along with this program.

 This program is distributed on the basis that it will form a useful
 contribution to risk analytics and model standardisation, but WITHOUT
 ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
 FITNESS FOR A PARTICULAR PURPOSE. See the license for more details.
*/

/*! \file hret/toplevelfixture.hpp
    \brief Fixture that can be used at top level
*/

#pragma once

#include <boost/test/unit_test.hpp>
#include <hred/utilities/log.hpp>

namespace hre {
namespace test {

//! Top level fixture
/*! Saves the log state at the start of every test case and restores it afterwards, so that a test which
    registers its own logger or changes the mask leaves the suite logging untouched.
 */
class TopLevelFixture {
public:
    unsigned savedLogMask;
    bool savedLogEnabled;

    /*! Constructor
        Add things here that you want to happen at the start of every test case
    */
    TopLevelFixture()
        : savedLogMask(hre::data::Log::instance().mask()), savedLogEnabled(hre::data::Log::instance().enabled()) {}

    /*! Destructor
        Add things here that you want to happen after _every_ test case
    */
    virtual ~TopLevelFixture() {
        hre::data::Log::instance().setMask(savedLogMask);
        if (savedLogEnabled)
            hre::data::Log::instance().switchOn();
        else
            hre::data::Log::instance().switchOff();
        // Remove the buffer logger a test may have registered
        if (hre::data::Log::instance().hasLogger(hre::data::BufferLogger::name))
            hre::data::Log::instance().removeLogger(hre::data::BufferLogger::name);
    }
};
} // namespace test
} // namespace hre
