//  Copyright 2026 Yurun Zi
//
//  Licensed under the Apache License, Version 2.0 (the "License");
//  you may not use this file except in compliance with the License.
//  You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.

#include "edit/operators/operator_registeration.hpp"

#include <mutex>

#include "edit/operators/background/background_extract_op.hpp"
#include "edit/operators/color/lab_channel_scale_op.hpp"
#include "edit/operators/color/saturation_op.hpp"
#include "edit/operators/color/white_balance_op.hpp"
#include "edit/operators/detail/denoise_op.hpp"
#include "edit/operators/detail/sharpen_op.hpp"
#include "edit/operators/operator_factory.hpp"
#include "edit/operators/star/star_reduce_op.hpp"
#include "edit/operators/tone/clahe_op.hpp"
#include "edit/operators/tone/gamma_curve_op.hpp"
#include "edit/operators/tone/histogram_stretch_op.hpp"
#include "edit/operators/tone/tone_curve_op.hpp"

namespace astroslide {
void RegisterAllOperators() {
  static std::once_flag registered;
  std::call_once(registered, []() {
    auto& factory = OperatorFactory::Instance();
    factory.Register<WhiteBalanceOp>();
    factory.Register<GammaCurveOp>();
    factory.Register<LabChannelScaleOp>();
    factory.Register<SaturationOp>();
    factory.Register<ClaheOp>();
    factory.Register<SharpenOp>();
    factory.Register<DenoiseOp>();
    factory.Register<StarReduceOp>();
    factory.Register<HistogramStretchOp>();
    factory.Register<BackgroundExtractOp>();
    factory.Register<ToneCurveOp>();
  });
}
};  // namespace astroslide
