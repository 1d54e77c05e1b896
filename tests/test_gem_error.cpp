#include "GemLink/GemError.h"

using GemLink::CategoryOf;
using GemLink::GemErrorCategory;
using GemLink::GemErrorCode;
using GemLink::OperationResult;

static_assert(CategoryOf(GemErrorCode::kNone) == GemErrorCategory::kNone);
static_assert(CategoryOf(GemErrorCode::kDuplicateTemplateId) == GemErrorCategory::kConfiguration);
static_assert(CategoryOf(GemErrorCode::kUnknownTemplateId) == GemErrorCategory::kLookupMiss);
static_assert(CategoryOf(GemErrorCode::kSocketColorMismatch) == GemErrorCategory::kInvalidSocketOperation);
static_assert(CategoryOf(GemErrorCode::kSelfLink) == GemErrorCategory::kInvalidSocketOperation);
static_assert(CategoryOf(GemErrorCode::kInsufficientResource) == GemErrorCategory::kIneligibleSkillUse);
static_assert(CategoryOf(GemErrorCode::kNegativeExperience) == GemErrorCategory::kInvalidInput);

static_assert(static_cast<bool>(OperationResult::Ok()));
static_assert(!OperationResult::Fail(GemErrorCode::kSocketOccupied));
static_assert(OperationResult::Fail(GemErrorCode::kSocketOccupied).Category() == GemErrorCategory::kInvalidSocketOperation);
static_assert(GemLink::DescribeGemError(GemErrorCode::kNone) == "ok");
