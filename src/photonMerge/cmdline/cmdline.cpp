// This file is part of the photonMerge project.
// Copyright (c) 2024 photonMerge contributors.
// This Source Code Form is subject to the terms of the Mozilla Public License,
// v. 2.0. If a copy of the MPL was not distributed with this file,
// You can obtain one at https://mozilla.org/MPL/2.0/.

#include "cmdline.hpp"

#include <photonMerge/system/Logger.hpp>

#include <boost/program_options/errors.hpp>
#include <boost/program_options/parsers.hpp>
#include <boost/program_options/value_semantic.hpp>

#include <sstream>
#include <vector>

namespace photonMerge {

namespace {

template <typename T>
void printVector(std::ostream& os, const std::vector<T>& vect)
{
    os << "[";
    for (std::size_t i = 0; i < vect.size(); ++i)
    {
        if (i > 0)
            os << ", ";
        os << vect[i];
    }
    os << "]";
}

}  // namespace

void printOptionValue(std::ostream& os, const boost::any& value)
{
    if (value.type() == typeid(int))
        os << boost::any_cast<int>(value);
    else if (value.type() == typeid(unsigned int))
        os << boost::any_cast<unsigned int>(value);
    else if (value.type() == typeid(std::size_t))
        os << boost::any_cast<std::size_t>(value);
    else if (value.type() == typeid(bool))
        os << boost::any_cast<bool>(value);
    else if (value.type() == typeid(float))
        os << boost::any_cast<float>(value);
    else if (value.type() == typeid(double))
        os << boost::any_cast<double>(value);
    else if (value.type() == typeid(std::string))
        os << "\"" << boost::any_cast<std::string>(value) << "\"";
    else if (value.type() == typeid(std::vector<std::string>))
        printVector(os, boost::any_cast<std::vector<std::string>>(value));
    else if (value.type() == typeid(std::vector<float>))
        printVector(os, boost::any_cast<std::vector<float>>(value));
    else if (value.type() == typeid(system::EVerboseLevel))
        os << boost::any_cast<system::EVerboseLevel>(value);
    else
        os << "<" << value.type().name() << ">";
}

void printVariablesMap(std::ostream& os, const boost::program_options::variables_map& vm)
{
    for (const auto& v : vm)
    {
        const std::string& optionName = v.first;
        const boost::program_options::variable_value& var = v.second;

        os << " * " << optionName << " = ";
        printOptionValue(os, var.value());

        if (var.value().empty())
            os << " (empty)";
        if (var.defaulted())
            os << " (default)";
        os << std::endl;
    }
}

bool CmdLine::execute(int argc, char** argv)
{
    namespace po = boost::program_options;

    system::EVerboseLevel verboseLevel = system::Logger::getDefaultVerboseLevel();

    po::options_description commonParams("Log and hardware parameters");
    // clang-format off
    commonParams.add_options()
        ("help,h", "Print this help message.")
        ("verboseLevel,v", po::value<system::EVerboseLevel>(&verboseLevel)->default_value(verboseLevel),
         ("Verbosity level: " + system::EVerboseLevel_informations() + ".").c_str());
    // clang-format on
    _hContext.setupFromCommandLine(commonParams);

    _allParams.add(commonParams);

    po::variables_map vm;
    try
    {
        po::store(po::parse_command_line(argc, argv, _allParams), vm);

        if (vm.count("help") || argc == 1)
        {
            PHOTONMERGE_COUT(_allParams);
            return false;
        }
        po::notify(vm);
    }
    catch (const po::error& e)
    {
        PHOTONMERGE_CERR("ERROR: " << e.what());
        PHOTONMERGE_COUT("Usage:\n\n" << _allParams);
        return false;
    }

    system::Logger::get().setLogLevel(verboseLevel);

    std::stringstream parameters;
    printVariablesMap(parameters, vm);
    PHOTONMERGE_LOG_INFO("Program called with the following parameters:\n" << parameters.str());

    return true;
}

}  // namespace photonMerge
