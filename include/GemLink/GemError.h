#pragma once

#include <cstdint>
#include <string_view>

namespace GemLink
{
	enum class GemErrorCategory : std::uint8_t
	{
		kNone = 0,
		kConfiguration,
		kLookupMiss,
		kInvalidSocketOperation,
		kIneligibleSkillUse,
		kInvalidInput,
	};

	enum class GemErrorCode : std::uint8_t
	{
		kNone = 0,

		kDuplicateTemplateId,
		kInvalidTemplate,

		kUnknownTemplateId,

		kSocketOccupied,
		kSocketColorMismatch,
		kSocketIndexOutOfRange,
		kSelfLink,

		kMissingActiveGem,
		kInsufficientResource,
		kRequirementsUnmet,

		kNegativeExperience,
		kQualityOutOfRange,
		kLevelOutOfRange,
	};

	[[nodiscard]] constexpr GemErrorCategory CategoryOf(GemErrorCode a_code) noexcept
	{
		switch (a_code) {
		case GemErrorCode::kNone:
			return GemErrorCategory::kNone;
		case GemErrorCode::kDuplicateTemplateId:
		case GemErrorCode::kInvalidTemplate:
			return GemErrorCategory::kConfiguration;
		case GemErrorCode::kUnknownTemplateId:
			return GemErrorCategory::kLookupMiss;
		case GemErrorCode::kSocketOccupied:
		case GemErrorCode::kSocketColorMismatch:
		case GemErrorCode::kSocketIndexOutOfRange:
		case GemErrorCode::kSelfLink:
			return GemErrorCategory::kInvalidSocketOperation;
		case GemErrorCode::kMissingActiveGem:
		case GemErrorCode::kInsufficientResource:
		case GemErrorCode::kRequirementsUnmet:
			return GemErrorCategory::kIneligibleSkillUse;
		case GemErrorCode::kNegativeExperience:
		case GemErrorCode::kQualityOutOfRange:
		case GemErrorCode::kLevelOutOfRange:
			return GemErrorCategory::kInvalidInput;
		}
		return GemErrorCategory::kNone;
	}

	[[nodiscard]] constexpr std::string_view DescribeGemError(GemErrorCode a_code) noexcept
	{
		switch (a_code) {
		case GemErrorCode::kNone:
			return "ok";
		case GemErrorCode::kDuplicateTemplateId:
			return "duplicate template id";
		case GemErrorCode::kInvalidTemplate:
			return "invalid template definition";
		case GemErrorCode::kUnknownTemplateId:
			return "unknown template id";
		case GemErrorCode::kSocketOccupied:
			return "socket occupied";
		case GemErrorCode::kSocketColorMismatch:
			return "socket color mismatch";
		case GemErrorCode::kSocketIndexOutOfRange:
			return "socket index out of range";
		case GemErrorCode::kSelfLink:
			return "socket cannot link to itself";
		case GemErrorCode::kMissingActiveGem:
			return "setup has no active gem";
		case GemErrorCode::kInsufficientResource:
			return "insufficient resource";
		case GemErrorCode::kRequirementsUnmet:
			return "requirements unmet";
		case GemErrorCode::kNegativeExperience:
			return "negative experience";
		case GemErrorCode::kQualityOutOfRange:
			return "quality out of range";
		case GemErrorCode::kLevelOutOfRange:
			return "level out of range";
		}
		return "unknown";
	}

	struct OperationResult
	{
		bool success{ false };
		GemErrorCode code{ GemErrorCode::kNone };

		[[nodiscard]] static constexpr OperationResult Ok() noexcept
		{
			return OperationResult{ .success = true, .code = GemErrorCode::kNone };
		}

		[[nodiscard]] static constexpr OperationResult Fail(GemErrorCode a_code) noexcept
		{
			return OperationResult{ .success = false, .code = a_code };
		}

		[[nodiscard]] constexpr GemErrorCategory Category() const noexcept { return CategoryOf(code); }
		[[nodiscard]] constexpr explicit operator bool() const noexcept { return success; }
	};
}
