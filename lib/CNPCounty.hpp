#ifndef CNP_ANALYZER_CNP_COUNTY_H_
#define CNP_ANALYZER_CNP_COUNTY_H_

#include <string>

class CNPCounty {
 public:
  // Name used for codes missing from the table.
  static const char* UnknownName() {
    return "Necunoscut";
  }

  // Looks up the county (or Bucharest sector) a two-digit code was issued
  // in. Returns false for codes not in the table.
  static bool Lookup(int code, std::string* name) {
    struct Entry {
      int code;
      const char* name;
    };
    static const Entry table[] = {
      {1, "Alba"},
      {2, "Arad"},
      {3, "Argeș"},
      {4, "Bacău"},
      {5, "Bihor"},
      {6, "Bistrița-Năsăud"},
      {7, "Botoșani"},
      {8, "Brașov"},
      {9, "Brăila"},
      {10, "Buzău"},
      {11, "Caraș-Severin"},
      {12, "Cluj"},
      {13, "Constanța"},
      {14, "Covasna"},
      {15, "Dâmbovița"},
      {16, "Dolj"},
      {17, "Galați"},
      {18, "Gorj"},
      {19, "Harghita"},
      {20, "Hunedoara"},
      {21, "Ialomița"},
      {22, "Iași"},
      {23, "Ilfov"},
      {24, "Maramureș"},
      {25, "Mehedinți"},
      {26, "Mureș"},
      {27, "Neamț"},
      {28, "Olt"},
      {29, "Prahova"},
      {30, "Satu Mare"},
      {31, "Sălaj"},
      {32, "Sibiu"},
      {33, "Suceava"},
      {34, "Teleorman"},
      {35, "Timiș"},
      {36, "Tulcea"},
      {37, "Vaslui"},
      {38, "Vâlcea"},
      {39, "Vrancea"},
      {40, "București"},
      {41, "București (Sector 1)"},
      {42, "București (Sector 2)"},
      {43, "București (Sector 3)"},
      {44, "București (Sector 4)"},
      {45, "București (Sector 5)"},
      {46, "București (Sector 6)"},
      // Sectors 7 and 8 no longer exist but still appear in old CNPs.
      {47, "București (Sector 7)"},
      {48, "București (Sector 8)"},
      {51, "Călărași"},
      {52, "Giurgiu"},
    };

    for (const Entry& entry : table) {
      if (entry.code == code) {
        *name = entry.name;
        return true;
      }
    }
    return false;
  }

  // Name for the code, or UnknownName() if there is none.
  static std::string NameOf(int code) {
    std::string name;
    if (!Lookup(code, &name)) {
      return UnknownName();
    }
    return name;
  }
};

#endif  // CNP_ANALYZER_CNP_COUNTY_H_
