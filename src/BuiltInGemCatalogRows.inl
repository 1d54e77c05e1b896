// Active gems.
{ "fireball", "Fireball", GemKind::kActive,
	GemRequirements{ .level = 1, .strength = 0, .dexterity = 0, .intelligence = 12 },
	StatBlock{ { StatKey::kDamage, 15.0 }, { StatKey::kProjectileSpeed, 200.0 }, { StatKey::kManaCost, 6.0 }, { StatKey::kCastTime, 0.75 }, { StatKey::kRadius, 15.0 } },
	"Casts a fiery projectile that explodes on impact", "spell,projectile,fire,aoe" },
{ "ice_nova", "Ice Nova", GemKind::kActive,
	GemRequirements{ .level = 1, .strength = 0, .dexterity = 0, .intelligence = 12 },
	StatBlock{ { StatKey::kDamage, 20.0 }, { StatKey::kManaCost, 8.0 }, { StatKey::kCastTime, 0.7 }, { StatKey::kRadius, 25.0 } },
	"Creates an expanding ring of ice around the caster", "spell,aoe,cold" },
{ "lightning_bolt", "Lightning Bolt", GemKind::kActive,
	GemRequirements{ .level = 1, .strength = 0, .dexterity = 0, .intelligence = 12 },
	StatBlock{ { StatKey::kDamage, 12.0 }, { StatKey::kManaCost, 5.0 }, { StatKey::kCastTime, 0.5 }, { StatKey::kChainCount, 3.0 } },
	"Casts a bolt of lightning that chains between enemies", "spell,projectile,lightning,chaining" },
{ "heavy_strike", "Heavy Strike", GemKind::kActive,
	GemRequirements{ .level = 1, .strength = 12, .dexterity = 0, .intelligence = 0 },
	StatBlock{ { StatKey::kDamageMultiplier, 1.44 }, { StatKey::kManaCost, 6.0 }, { StatKey::kAttackTime, 1.0 } },
	"Attacks with increased damage and knockback", "attack,melee" },
{ "double_strike", "Double Strike", GemKind::kActive,
	GemRequirements{ .level = 1, .strength = 8, .dexterity = 8, .intelligence = 0 },
	StatBlock{ { StatKey::kDamageMultiplier, 0.91 }, { StatKey::kAttackCount, 2.0 }, { StatKey::kManaCost, 5.0 }, { StatKey::kAttackTime, 0.8 } },
	"Performs two quick strikes in succession", "attack,melee" },
{ "burning_arrow", "Burning Arrow", GemKind::kActive,
	GemRequirements{ .level = 1, .strength = 0, .dexterity = 12, .intelligence = 0 },
	StatBlock{ { StatKey::kDamageMultiplier, 1.2 }, { StatKey::kBurnDamage, 10.0 }, { StatKey::kBurnDuration, 4.0 }, { StatKey::kManaCost, 4.0 } },
	"Fires an arrow that burns enemies over time", "attack,projectile,bow,fire" },
{ "split_arrow", "Split Arrow", GemKind::kActive,
	GemRequirements{ .level = 1, .strength = 0, .dexterity = 12, .intelligence = 0 },
	StatBlock{ { StatKey::kDamageMultiplier, 0.7 }, { StatKey::kProjectileCount, 3.0 }, { StatKey::kManaCost, 6.0 } },
	"Fires multiple arrows in a spread", "attack,projectile,bow" },

// Support gems.
{ "added_fire_damage", "Added Fire Damage Support", GemKind::kSupport,
	GemRequirements{ .level = 8, .strength = 14, .dexterity = 0, .intelligence = 0 },
	StatBlock{ { StatKey::kAddedFireDamagePercent, 44.0 }, { StatKey::kManaCostMultiplier, 1.2 } },
	"Supported skills have added fire damage", "fire" },
{ "added_cold_damage", "Added Cold Damage Support", GemKind::kSupport,
	GemRequirements{ .level = 8, .strength = 0, .dexterity = 0, .intelligence = 14 },
	StatBlock{ { StatKey::kAddedColdDamagePercent, 39.0 }, { StatKey::kFreezeChance, 10.0 }, { StatKey::kManaCostMultiplier, 1.2 } },
	"Supported skills have added cold damage and freeze chance", "cold" },
{ "added_lightning_damage", "Added Lightning Damage Support", GemKind::kSupport,
	GemRequirements{ .level = 8, .strength = 0, .dexterity = 0, .intelligence = 14 },
	StatBlock{ { StatKey::kAddedLightningDamagePercent, 42.0 }, { StatKey::kManaCostMultiplier, 1.2 } },
	"Supported skills have added lightning damage", "lightning" },
{ "faster_casting", "Faster Casting Support", GemKind::kSupport,
	GemRequirements{ .level = 8, .strength = 0, .dexterity = 0, .intelligence = 14 },
	StatBlock{ { StatKey::kCastSpeedMultiplier, 1.44 }, { StatKey::kManaCostMultiplier, 1.2 } },
	"Supported skills cast faster", "spell" },
{ "melee_physical_damage", "Melee Physical Damage Support", GemKind::kSupport,
	GemRequirements{ .level = 8, .strength = 14, .dexterity = 0, .intelligence = 0 },
	StatBlock{ { StatKey::kPhysicalDamageMultiplier, 1.49 }, { StatKey::kManaCostMultiplier, 1.25 } },
	"Supported skills deal more physical damage", "attack,melee" },
{ "pierce", "Pierce Support", GemKind::kSupport,
	GemRequirements{ .level = 8, .strength = 0, .dexterity = 14, .intelligence = 0 },
	StatBlock{ { StatKey::kPierceChance, 100.0 }, { StatKey::kPierceCount, 3.0 }, { StatKey::kDamageMultiplier, 0.9 }, { StatKey::kManaCostMultiplier, 1.15 } },
	"Supported projectiles pierce through enemies", "projectile" },
{ "lesser_multiple_projectiles", "Lesser Multiple Projectiles Support", GemKind::kSupport,
	GemRequirements{ .level = 8, .strength = 0, .dexterity = 14, .intelligence = 0 },
	StatBlock{ { StatKey::kProjectileCount, 3.0 }, { StatKey::kDamageMultiplier, 0.75 }, { StatKey::kManaCostMultiplier, 1.4 } },
	"Supported skills fire additional projectiles", "projectile" },
{ "multistrike", "Multistrike Support", GemKind::kSupport,
	GemRequirements{ .level = 38, .strength = 14, .dexterity = 14, .intelligence = 0 },
	StatBlock{ { StatKey::kAttackRepeatCount, 2.0 }, { StatKey::kDamageMultiplier, 0.7 }, { StatKey::kAttackSpeedMultiplier, 1.94 }, { StatKey::kManaCostMultiplier, 1.6 } },
	"Supported skills repeat twice more", "attack,melee" },
{ "spell_echo", "Spell Echo Support", GemKind::kSupport,
	GemRequirements{ .level = 38, .strength = 0, .dexterity = 0, .intelligence = 25 },
	StatBlock{ { StatKey::kSpellRepeatCount, 1.0 }, { StatKey::kDamageMultiplier, 0.7 }, { StatKey::kCastSpeedMultiplier, 1.69 }, { StatKey::kManaCostMultiplier, 1.4 } },
	"Supported spells repeat an additional time", "spell" },
{ "critical_strikes", "Increased Critical Strikes Support", GemKind::kSupport,
	GemRequirements{ .level = 8, .strength = 0, .dexterity = 14, .intelligence = 0 },
	StatBlock{ { StatKey::kCriticalChanceMultiplier, 1.9 }, { StatKey::kCriticalMultiplierMultiplier, 1.3 }, { StatKey::kManaCostMultiplier, 1.2 } },
	"Supported skills have increased critical strike chance and multiplier", "" },
