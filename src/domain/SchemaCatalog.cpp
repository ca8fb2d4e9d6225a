/**
 * @file SchemaCatalog.cpp
 * @brief Field lists, metrics and default weights of the built-in schemas.
 */

#include "domain/SchemaCatalog.hpp"

namespace annobench::domain {

namespace {

FieldSpec Field(const char* name, EvaluatorKind kind, double weight = 1.0) {
    FieldSpec spec;
    spec.name = name;
    spec.kind = kind;
    spec.weight = weight;
    return spec;
}

FieldSpec StatisticField(const char* name) {
    FieldSpec spec = Field(name, EvaluatorKind::CompoundStatistic);
    spec.tolerance.within10Pct = 0.7;
    return spec;
}

} // namespace

AnnotationSchema SchemaCatalog::Phenotype() {
    return AnnotationSchema("phenotype", {
        Field("Variant/Haplotypes", EvaluatorKind::VariantIdentity, 1.0),
        Field("Gene", EvaluatorKind::SemanticSet, 1.0),
        Field("Drug(s)", EvaluatorKind::SemanticSet, 1.5),
        Field("Phenotype Category", EvaluatorKind::CategoryEqual, 0.5),
        Field("Alleles", EvaluatorKind::SemanticSet, 1.5),
        Field("Is/Is Not associated", EvaluatorKind::CategoryEqual, 1.0),
        Field("Direction of effect", EvaluatorKind::CategoryEqual, 2.0),
        Field("Phenotype", EvaluatorKind::SemanticSet, 2.0),
        Field("When treated with/exposed to/when assayed with", EvaluatorKind::SemanticSet, 0.5),
        Field("Comparison Allele(s) or Genotype(s)", EvaluatorKind::SemanticSet, 1.0),
    });
}

AnnotationSchema SchemaCatalog::Drug() {
    return AnnotationSchema("drug", {
        Field("Variant/Haplotypes", EvaluatorKind::VariantIdentity, 1.0),
        Field("Gene", EvaluatorKind::FuzzyEntity, 1.0),
        Field("Drug(s)", EvaluatorKind::SemanticSet, 1.5),
        Field("Phenotype Category", EvaluatorKind::CategoryEqual, 0.5),
        Field("Significance", EvaluatorKind::CategoryEqual, 1.2),
        Field("Alleles", EvaluatorKind::VariantIdentity, 1.5),
        Field("Specialty Population", EvaluatorKind::CategoryEqual, 0.6),
        Field("Metabolizer types", EvaluatorKind::CategoryEqual, 0.5),
        Field("isPlural", EvaluatorKind::CategoryEqual, 0.25),
        Field("Is/Is Not associated", EvaluatorKind::CategoryEqual, 1.0),
        Field("Direction of effect", EvaluatorKind::CategoryEqual, 2.0),
        Field("PD/PK terms", EvaluatorKind::SemanticSet, 1.0),
        Field("Multiple drugs And/or", EvaluatorKind::CategoryEqual, 0.25),
        Field("Population types", EvaluatorKind::CategoryEqual, 0.5),
        Field("Population Phenotypes or diseases", EvaluatorKind::SemanticSet, 0.6),
        Field("Multiple phenotypes or diseases And/or", EvaluatorKind::CategoryEqual, 0.25),
        Field("Comparison Allele(s) or Genotype(s)", EvaluatorKind::VariantIdentity, 1.0),
        Field("Comparison Metabolizer types", EvaluatorKind::CategoryEqual, 0.5),
        Field("Sentence", EvaluatorKind::SemanticSet, 0.1),
    });
}

AnnotationSchema SchemaCatalog::Functional() {
    return AnnotationSchema("functional", {
        Field("Variant/Haplotypes", EvaluatorKind::VariantIdentity, 1.0),
        Field("Gene", EvaluatorKind::FuzzyEntity, 1.0),
        Field("Drug(s)", EvaluatorKind::SemanticSet, 1.5),
        Field("Phenotype Category", EvaluatorKind::CategoryEqual, 0.5),
        Field("Significance", EvaluatorKind::CategoryEqual, 1.2),
        Field("Alleles", EvaluatorKind::VariantIdentity, 1.5),
        Field("Specialty Population", EvaluatorKind::CategoryEqual, 0.6),
        Field("Assay type", EvaluatorKind::SemanticSet, 1.0),
        Field("Metabolizer types", EvaluatorKind::CategoryEqual, 0.5),
        Field("isPlural", EvaluatorKind::CategoryEqual, 0.25),
        Field("Is/Is Not associated", EvaluatorKind::CategoryEqual, 1.0),
        Field("Direction of effect", EvaluatorKind::CategoryEqual, 2.0),
        Field("Functional terms", EvaluatorKind::SemanticSet, 2.0),
        Field("Gene/gene product", EvaluatorKind::FuzzyEntity, 1.0),
        Field("When treated with/exposed to/when assayed with", EvaluatorKind::SemanticSet, 0.5),
        Field("Multiple drugs And/or", EvaluatorKind::CategoryEqual, 0.25),
        Field("Cell type", EvaluatorKind::SemanticSet, 0.5),
        Field("Comparison Allele(s) or Genotype(s)", EvaluatorKind::VariantIdentity, 1.0),
        Field("Comparison Metabolizer types", EvaluatorKind::CategoryEqual, 0.5),
    });
}

AnnotationSchema SchemaCatalog::StudyParameters() {
    FieldRoles roles;
    roles.pValue = "P Value";
    roles.ratioStat = "Ratio Stat";
    roles.ratioStatType = "Ratio Stat Type";
    roles.ciStart = "Confidence Interval Start";
    roles.ciStop = "Confidence Interval Stop";
    roles.crossReference = "Variant Annotation ID";
    roles.referencedIdentifier = "Variant Annotation ID";
    roles.frequencies = {"Frequency in Cases", "Frequency in Controls"};
    roles.sampleSizes = {"Study Cases", "Study Controls"};
    roles.identifiers = {"Study Parameters ID", "Variant Annotation ID"};

    return AnnotationSchema("study_parameters", {
        Field("Study Parameters ID", EvaluatorKind::ExactMatch),
        Field("Variant Annotation ID", EvaluatorKind::ExactMatch),
        Field("Study Type", EvaluatorKind::CategoryEqual),
        Field("Study Cases", EvaluatorKind::NumericTolerance),
        Field("Study Controls", EvaluatorKind::NumericTolerance),
        Field("Characteristics", EvaluatorKind::SemanticSet),
        Field("Characteristics Type", EvaluatorKind::CategoryEqual),
        Field("Frequency in Cases", EvaluatorKind::NumericTolerance),
        Field("Allele of Frequency in Cases", EvaluatorKind::SemanticSet),
        Field("Frequency in Controls", EvaluatorKind::NumericTolerance),
        Field("Allele of Frequency in Controls", EvaluatorKind::SemanticSet),
        StatisticField("P Value"),
        Field("Ratio Stat Type", EvaluatorKind::CategoryEqual),
        Field("Ratio Stat", EvaluatorKind::NumericTolerance),
        Field("Confidence Interval Start", EvaluatorKind::NumericTolerance),
        Field("Confidence Interval Stop", EvaluatorKind::NumericTolerance),
        Field("Biogeographical Groups", EvaluatorKind::CategoryEqual),
    }, roles);
}

std::optional<AnnotationSchema> SchemaCatalog::ByName(const std::string& family) {
    if (family == "phenotype") return Phenotype();
    if (family == "drug") return Drug();
    if (family == "functional") return Functional();
    if (family == "study_parameters") return StudyParameters();
    return std::nullopt;
}

} // namespace annobench::domain
