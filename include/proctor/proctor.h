#pragma once

/**
 * @file proctor.h
 * @brief Umbrella header for the Proctor attention analysis library
 */

#include "proctor/core/types.hpp"
#include "proctor/core/exception.h"
#include "proctor/core/Logger.hpp"
#include "proctor/core/Configuration.hpp"
#include "proctor/detection/DetectionTypes.hpp"
#include "proctor/detection/AngleSmoother.hpp"
#include "proctor/detection/HeadPoseSolver.hpp"
#include "proctor/detection/LandmarkGeometry.hpp"
#include "proctor/detection/ViolationTracker.hpp"
#include "proctor/report/ReportTypes.hpp"
#include "proctor/report/EventReportBuilder.hpp"
#include "proctor/report/ReportWriter.hpp"
#include "proctor/pipeline/FrameSampler.hpp"
#include "proctor/pipeline/SessionAnalyzer.hpp"
#include "proctor/io/SignalReader.hpp"
