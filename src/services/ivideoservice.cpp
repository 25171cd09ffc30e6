/**
 * @file ivideoservice.cpp
 * @brief Implementation file for IVideoService interface.
 *
 * This file exists to support Qt's MOC (Meta-Object Compiler) which requires
 * a .cpp file to generate signal/slot infrastructure for the interface.
 */

#include "ivideoservice.h"
