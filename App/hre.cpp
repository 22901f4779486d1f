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

#include <hrea/app/hreapp.hpp>
#include <hrea/version.hpp>

#include <iostream>

using namespace std;
using namespace hre::data;
using namespace hre::analytics;

int main(int argc, char** argv) {

    if (argc == 2 && (string(argv[1]) == "-v" || string(argv[1]) == "--version")) {
        cout << "HRE version " << HRE_VERSION << endl;
        exit(0);
    }

    if (argc != 2) {
        std::cout << endl << "usage: hre path/to/hre.xml" << endl << endl;
        return -1;
    }

    string inputFile(argv[1]);

    try {
        auto params = QuantLib::ext::make_shared<Parameters>();
        params->fromFile(inputFile);
        HREApp hre(params, true);
        return hre.run() ? 0 : -1;
    } catch (const exception& e) {
        cout << endl << "an error occurred: " << e.what() << endl;
        return -1;
    }
}
